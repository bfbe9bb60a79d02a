#include "gtest/gtest.h"

#include "opcode/wasm_opcode_info.h"

#include <memory>
#include <vector>

using namespace WasmAbi;

namespace
{

std::unique_ptr<WasmOpcodeInfoTable> BuildTable(const std::vector<WasmOpcodeDefinition>& defs)
{
    return std::make_unique<WasmOpcodeInfoTable>(defs.data(), defs.size());
}

}   // anonymous namespace

TEST(WasmOpcodeTable, DenseOverAllEncodings)
{
    size_t numValid = 0;
    for (uint32_t code = 0; code < 256; code++)
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByCode(static_cast<uint8_t>(code));
        ReleaseAssert(info.m_encoding == code);
        if (info.m_isValid)
        {
            numValid++;
        }
        else
        {
            ReleaseAssert(info.m_name == "ILLEGAL");
            ReleaseAssert(info.m_immKind == WasmImmediateKind::None);
        }
    }
    ReleaseAssert(numValid == x_numWasmOpcodes);
    ReleaseAssert(numValid == g_wasmOpcodeInfoTable.GetNumDeclaredOpcodes());
    ReleaseAssert(numValid == 177);

    // unassigned encodings in the middle and at the end
    //
    ReleaseAssert(!g_wasmOpcodeInfoTable.ByCode(0x06).m_isValid);
    ReleaseAssert(!g_wasmOpcodeInfoTable.ByCode(0x12).m_isValid);
    ReleaseAssert(!g_wasmOpcodeInfoTable.ByCode(0x25).m_isValid);
    ReleaseAssert(!g_wasmOpcodeInfoTable.ByCode(0xC5).m_isValid);
    ReleaseAssert(!g_wasmOpcodeInfoTable.ByCode(0xFF).m_isValid);
}

TEST(WasmOpcodeTable, SortedByName)
{
    size_t n = g_wasmOpcodeInfoTable.GetNumDeclaredOpcodes();
    for (size_t i = 1; i < n; i++)
    {
        ReleaseAssert(g_wasmOpcodeInfoTable.GetSortedByName(i - 1).m_name < g_wasmOpcodeInfoTable.GetSortedByName(i).m_name);
    }
    ReleaseAssert(g_wasmOpcodeInfoTable.GetSortedByName(0).m_name == "block");
    ReleaseAssert(g_wasmOpcodeInfoTable.GetSortedByName(n - 1).m_name == "unreachable");
}

TEST(WasmOpcodeTable, LookupRoundTrip)
{
    size_t n = g_wasmOpcodeInfoTable.GetNumDeclaredOpcodes();
    for (size_t i = 0; i < n; i++)
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.GetSortedByName(i);
        const WasmOpcodeInfo& byName = g_wasmOpcodeInfoTable.ByName(info.m_name);
        ReleaseAssert(&byName == &info);
        ReleaseAssert(&g_wasmOpcodeInfoTable.ByCode(byName.m_encoding) == &info);
    }

    for (uint32_t code = 0; code < 256; code++)
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByCode(static_cast<uint8_t>(code));
        if (info.m_isValid)
        {
            ReleaseAssert(g_wasmOpcodeInfoTable.ByName(info.m_name) == info);
        }
    }
}

TEST(WasmOpcodeTable, NotFound)
{
    ReleaseAssert(g_wasmOpcodeInfoTable.TryByName("i32.frobnicate") == nullptr);
    ReleaseAssert(g_wasmOpcodeInfoTable.TryByName("") == nullptr);
    ReleaseAssert(g_wasmOpcodeInfoTable.TryByName("ILLEGAL") == nullptr);
    // prefix of a mnemonic, and a mnemonic with trailing garbage
    //
    ReleaseAssert(g_wasmOpcodeInfoTable.TryByName("i32.loa") == nullptr);
    ReleaseAssert(g_wasmOpcodeInfoTable.TryByName("i32.load ") == nullptr);
    ReleaseAssert(g_wasmOpcodeInfoTable.TryByName("aaa") == nullptr);
    ReleaseAssert(g_wasmOpcodeInfoTable.TryByName("zzz") == nullptr);

    EXPECT_THROW({ [[maybe_unused]] auto result = g_wasmOpcodeInfoTable.ByName("i32.frobnicate"); }, WasmOpcodeNotFound);

    try
    {
        [[maybe_unused]] auto result = g_wasmOpcodeInfoTable.ByName("nope");
        ReleaseAssert(false);
    }
    catch (const WasmOpcodeNotFound& e)
    {
        ReleaseAssert(std::string(e.what()) == "opcode not found: 'nope'");
    }
}

TEST(WasmOpcodeTable, SanityNop)
{
    const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("nop");
    ReleaseAssert(info.m_isValid);
    ReleaseAssert(!info.m_isSpecial);
    ReleaseAssert(info.m_encoding == 0x01);
    ReleaseAssert(info.m_immKind == WasmImmediateKind::None);
    ReleaseAssert(info.m_immBytes == 0);
    ReleaseAssert(info.m_pop[0] == WasmStackEffect::Void);
    ReleaseAssert(info.m_pop[1] == WasmStackEffect::Void);
    ReleaseAssert(info.m_push == WasmStackEffect::Void);
    ReleaseAssert(&info == &g_wasmOpcodeInfoTable.ByCode(WasmOpcode::NOP));
}

TEST(WasmOpcodeTable, SanityI32Load)
{
    const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("i32.load");
    ReleaseAssert(info.m_encoding == 0x28);
    ReleaseAssert(!info.m_isSpecial);
    ReleaseAssert(info.m_immKind == WasmImmediateKind::MemArg);
    ReleaseAssert(info.m_immBytes == 8);
    ReleaseAssert(info.m_pop[0] == WasmStackEffect::I32);
    ReleaseAssert(info.m_pop[1] == WasmStackEffect::Void);
    ReleaseAssert(info.m_push == WasmStackEffect::I32);
}

TEST(WasmOpcodeTable, StackEffects)
{
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByCode(WasmOpcode::I32_STORE);
        ReleaseAssert(info.m_pop[0] == WasmStackEffect::I32 && info.m_pop[1] == WasmStackEffect::I32);
        ReleaseAssert(info.m_push == WasmStackEffect::Void);
    }
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("f64.store");
        ReleaseAssert(info.m_pop[0] == WasmStackEffect::I32 && info.m_pop[1] == WasmStackEffect::F64);
    }
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("i64.eq");
        ReleaseAssert(info.m_pop[0] == WasmStackEffect::I64 && info.m_pop[1] == WasmStackEffect::I64);
        ReleaseAssert(info.m_push == WasmStackEffect::I32);
    }
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("f32.demote_f64");
        ReleaseAssert(info.m_pop[0] == WasmStackEffect::F64 && info.m_pop[1] == WasmStackEffect::Void);
        ReleaseAssert(info.m_push == WasmStackEffect::F32);
    }
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("i64.extend32_s");
        ReleaseAssert(info.m_encoding == 0xC4);
        ReleaseAssert(info.m_pop[0] == WasmStackEffect::I64 && info.m_push == WasmStackEffect::I64);
    }
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("memory.grow");
        ReleaseAssert(info.m_immKind == WasmImmediateKind::U32);
        ReleaseAssert(info.m_pop[0] == WasmStackEffect::I32 && info.m_push == WasmStackEffect::I32);
    }
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByName("f64.const");
        ReleaseAssert(info.m_immKind == WasmImmediateKind::F64 && info.m_immBytes == 8);
        ReleaseAssert(info.m_pop[0] == WasmStackEffect::Void && info.m_push == WasmStackEffect::F64);
    }
}

TEST(WasmOpcodeTable, SpecialOpcodes)
{
    const char* const special[] = {
        "unreachable", "block", "loop", "if", "else", "end", "br", "br_if", "br_table", "return",
        "call", "call_indirect", "drop", "select",
        "local.get", "local.set", "local.tee", "global.get", "global.set"
    };
    for (const char* name : special)
    {
        ReleaseAssert(g_wasmOpcodeInfoTable.ByName(name).m_isSpecial);
    }

    size_t numSpecial = 0;
    for (uint32_t code = 0; code < 256; code++)
    {
        if (g_wasmOpcodeInfoTable.ByCode(static_cast<uint8_t>(code)).m_isSpecial)
        {
            numSpecial++;
        }
    }
    ReleaseAssert(numSpecial == sizeof(special) / sizeof(special[0]));

    // The fixed part of a context-dependent stack effect
    //
    ReleaseAssert(g_wasmOpcodeInfoTable.ByName("if").m_pop[0] == WasmStackEffect::I32);
    ReleaseAssert(g_wasmOpcodeInfoTable.ByName("if").m_immKind == WasmImmediateKind::TypeTag);
    ReleaseAssert(g_wasmOpcodeInfoTable.ByName("br_table").m_immKind == WasmImmediateKind::BrTable);
    ReleaseAssert(g_wasmOpcodeInfoTable.ByName("call_indirect").m_immKind == WasmImmediateKind::U32z);
    ReleaseAssert(g_wasmOpcodeInfoTable.ByName("call_indirect").m_immBytes == 5);
}

TEST(WasmOpcodeTable, SignatureInference)
{
    using S0 = WasmStackSignature<void()>;
    static_assert(S0::x_push == WasmStackEffect::Void && S0::x_pop0 == WasmStackEffect::Void && S0::x_pop1 == WasmStackEffect::Void);

    using S1 = WasmStackSignature<double(int64_t)>;
    static_assert(S1::x_push == WasmStackEffect::F64 && S1::x_pop0 == WasmStackEffect::I64 && S1::x_pop1 == WasmStackEffect::Void);

    using S2 = WasmStackSignature<void(int32_t, float)>;
    static_assert(S2::x_push == WasmStackEffect::Void && S2::x_pop0 == WasmStackEffect::I32 && S2::x_pop1 == WasmStackEffect::F32);

    static_assert(IsWasmStackType<int32_t>::value && IsWasmStackType<double>::value && IsWasmStackType<void>::value);
    static_assert(!IsWasmStackType<uint32_t>::value && !IsWasmStackType<bool>::value && !IsWasmStackType<int8_t>::value);

    constexpr WasmOpcodeDefinition def = WasmOpcodeDefinition::Create<WasmImmMemArg, void(int32_t, int64_t)>(0x37, "i64.store", false);
    static_assert(def.m_immKind == WasmImmediateKind::MemArg);
    static_assert(def.m_pop0 == WasmStackEffect::I32 && def.m_pop1 == WasmStackEffect::I64 && def.m_push == WasmStackEffect::Void);
}

TEST(WasmOpcodeTable, ConstructionFaults)
{
    using D = WasmOpcodeDefinition;
    {
        std::vector<D> defs = {
            D::Create<WasmImmNone, void()>(0x01, "nop", false),
            D::Create<WasmImmNone, int32_t(int32_t, int32_t)>(0x6A, "i32.add", false)
        };
        auto table = BuildTable(defs);
        ReleaseAssert(table->GetStatus() == WasmOpcodeTableStatus::OK);
        ReleaseAssert(table->GetNumDeclaredOpcodes() == 2);
        ReleaseAssert(table->ByName("i32.add").m_encoding == 0x6A);
        ReleaseAssert(table->GetSortedByName(0).m_name == "i32.add");
        ReleaseAssert(!table->ByCode(0x00).m_isValid);
    }
    {
        std::vector<D> defs = {
            D::Create<WasmImmNone, void()>(0x01, "nop", false),
            D::Create<WasmImmNone, void()>(0x100, "wide", false)
        };
        ReleaseAssert(BuildTable(defs)->GetStatus() == WasmOpcodeTableStatus::BadEncoding);
    }
    {
        std::vector<D> defs = {
            D::Create<WasmImmNone, void()>(0x01, "nop", false),
            D::Create<WasmImmNone, void()>(0x01, "nop2", false)
        };
        ReleaseAssert(BuildTable(defs)->GetStatus() == WasmOpcodeTableStatus::DuplicateEncoding);
    }
    {
        std::vector<D> defs = {
            D::Create<WasmImmNone, void()>(0x01, "", false)
        };
        ReleaseAssert(BuildTable(defs)->GetStatus() == WasmOpcodeTableStatus::EmptyName);
    }
    {
        std::vector<D> defs = {
            D::Create<WasmImmNone, void()>(0x01, "nop", false),
            D::Create<WasmImmNone, void()>(0x02, "block", false),
            D::Create<WasmImmNone, void()>(0x03, "nop", false)
        };
        ReleaseAssert(BuildTable(defs)->GetStatus() == WasmOpcodeTableStatus::DuplicateName);
    }

    ReleaseAssert(std::string(WasmOpcodeTableStatusName(WasmOpcodeTableStatus::DuplicateName)) == "DuplicateName");
}

TEST(WasmOpcodeTable, ToString)
{
    ReleaseAssert(g_wasmOpcodeInfoTable.ByName("i32.load").ToString() ==
                  "Op( 0x28 \"i32.load\" {MemArg 8b} [I32,Void]->[I32] )");
    ReleaseAssert(g_wasmOpcodeInfoTable.ByName("f32.add").ToString() ==
                  "Op( 0x92 \"f32.add\" {None 0b} [F32,F32]->[F32] )");
    ReleaseAssert(g_wasmOpcodeInfoTable.ByCode(0xFF).ToString() ==
                  "Op( 0xff \"ILLEGAL\" {None 0b} [Void,Void]->[Void] )");
}

TEST(WasmOpcodeTable, Immediates)
{
    for (uint8_t k = 0; k < static_cast<uint8_t>(WasmImmediateKind::X_END_OF_ENUM); k++)
    {
        WasmImmediateKind kind = static_cast<WasmImmediateKind>(k);
        WasmImmediate imm = MakeImmediate(kind);
        ReleaseAssert(GetImmediateKind(imm) == kind);
        ReleaseAssert(GetImmediateBytes(imm) == WasmImmediateKindBytes(kind));
    }

    WasmImmediate imm = WasmImmMemArg { 16, 2 };
    ReleaseAssert(GetImmediateKind(imm) == WasmImmediateKind::MemArg);
    ReleaseAssert(std::get<WasmImmMemArg>(imm).m_offset == 16);
    EXPECT_THROW({ [[maybe_unused]] auto result = std::get<WasmImmU32>(imm); }, std::bad_variant_access);

    ReleaseAssert(WasmImmediateKindBytes(WasmImmediateKind::TypeTag) == 8);
    ReleaseAssert(WasmImmediateKindBytes(WasmImmediateKind::U32z) == 5);

    // The table and the immediate structs agree on the payload size of every opcode
    //
    for (uint32_t code = 0; code < 256; code++)
    {
        const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByCode(static_cast<uint8_t>(code));
        ReleaseAssert(info.m_immBytes == WasmImmediateKindBytes(info.m_immKind));
    }
}
