#pragma once

#include "wasmabi/common.h"
#include "wasm_stack_effect.h"
#include "wasm_immediate.h"
#include "wasm_opcode_list.h"

#include <stdexcept>

namespace WasmAbi
{

// One entry of an opcode list, as written in FOR_EACH_WASM_OPCODE
//
struct WasmOpcodeDefinition
{
    // Wider than a byte so that an out-of-range encoding can be diagnosed instead of silently truncated
    //
    uint32_t m_encoding;
    std::string_view m_name;
    bool m_isSpecial;
    WasmImmediateKind m_immKind;
    WasmStackEffect m_pop0;
    WasmStackEffect m_pop1;
    WasmStackEffect m_push;

    template<typename ImmType, typename Signature>
    static constexpr WasmOpcodeDefinition Create(uint32_t encoding, std::string_view name, bool isSpecial)
    {
        using S = WasmStackSignature<Signature>;
        return WasmOpcodeDefinition {
            encoding, name, isSpecial, ImmType::x_kind, S::x_pop0, S::x_pop1, S::x_push
        };
    }
};

struct alignas(8) WasmOpcodeInfo
{
    constexpr WasmOpcodeInfo()
        : m_isValid(false), m_isSpecial(false), m_encoding(0), m_immKind(WasmImmediateKind::None)
        , m_immBytes(0), m_pop { WasmStackEffect::Void, WasmStackEffect::Void }, m_push(WasmStackEffect::Void)
        , m_name("ILLEGAL")
    { }

    constexpr explicit WasmOpcodeInfo(const WasmOpcodeDefinition& def)
        : m_isValid(true), m_isSpecial(def.m_isSpecial), m_encoding(static_cast<uint8_t>(def.m_encoding))
        , m_immKind(def.m_immKind), m_immBytes(WasmImmediateKindBytes(def.m_immKind))
        , m_pop { def.m_pop0, def.m_pop1 }, m_push(def.m_push)
        , m_name(def.m_name)
    { }

    // The entry of every unassigned encoding
    //
    static constexpr WasmOpcodeInfo Illegal(uint8_t encoding)
    {
        WasmOpcodeInfo result;
        result.m_encoding = encoding;
        return result;
    }

    // Renders e.g. 'Op( 0x28 "i32.load" {MemArg 8b} [I32,Void]->[I32] )'
    //
    std::string WARN_UNUSED ToString() const;

    bool operator==(const WasmOpcodeInfo& other) const
    {
        return m_isValid == other.m_isValid && m_isSpecial == other.m_isSpecial && m_encoding == other.m_encoding &&
               m_immKind == other.m_immKind && m_immBytes == other.m_immBytes && m_pop[0] == other.m_pop[0] &&
               m_pop[1] == other.m_pop[1] && m_push == other.m_push && m_name == other.m_name;
    }

    bool operator!=(const WasmOpcodeInfo& other) const { return !(*this == other); }

    // False only for the ILLEGAL entries
    //
    bool m_isValid;

    // Does the stack effect depend on context (block type, function type, local type)?
    // If so, m_pop and m_push only describe the fixed part of it.
    //
    bool m_isSpecial;

    uint8_t m_encoding;

    WasmImmediateKind m_immKind;
    uint8_t m_immBytes;

    // m_pop[0] is the first operand, m_pop[1] the second
    //
    WasmStackEffect m_pop[2];
    WasmStackEffect m_push;

    std::string_view m_name;
};

static_assert(sizeof(WasmOpcodeInfo) == 24, "unexpected size");

enum class WasmOpcode : uint8_t
{
#define F(opcodeName, opcodeEncoding, ...) opcodeName = opcodeEncoding,
FOR_EACH_WASM_OPCODE
#undef F
};

enum class WasmOpcodeTableStatus : uint8_t
{
    OK,
    BadEncoding,
    DuplicateEncoding,
    EmptyName,
    DuplicateName
};

const char* WasmOpcodeTableStatusName(WasmOpcodeTableStatus status);

// Lookup by a mnemonic that no declared opcode has
//
class WasmOpcodeNotFound : public std::runtime_error
{
public:
    explicit WasmOpcodeNotFound(std::string_view name);
};

// The dense 256-entry table plus the mnemonic-sorted index over its assigned entries.
// Built once from a definition list and never modified afterwards.
// If the definition list is defective (see GetStatus()), the table must not be used.
//
class alignas(64) WasmOpcodeInfoTable
{
public:
    constexpr WasmOpcodeInfoTable(const WasmOpcodeDefinition* defs, size_t numDefs)
        : m_status(WasmOpcodeTableStatus::OK)
        , m_numDeclared(0)
        , m_sortedEncodings {}
        , m_info {}
    {
        for (uint32_t i = 0; i < 256; i++)
        {
            m_info[i] = WasmOpcodeInfo::Illegal(static_cast<uint8_t>(i));
        }

        for (size_t i = 0; i < numDefs; i++)
        {
            const WasmOpcodeDefinition& def = defs[i];
            if (def.m_encoding > 255)
            {
                m_status = WasmOpcodeTableStatus::BadEncoding;
                return;
            }
            if (m_info[def.m_encoding].m_isValid)
            {
                m_status = WasmOpcodeTableStatus::DuplicateEncoding;
                return;
            }
            if (def.m_name.empty())
            {
                m_status = WasmOpcodeTableStatus::EmptyName;
                return;
            }
            m_info[def.m_encoding] = WasmOpcodeInfo(def);
            m_sortedEncodings[m_numDeclared] = static_cast<uint8_t>(def.m_encoding);
            m_numDeclared++;
        }

        // Insertion sort by mnemonic, in byte-wise lexicographic order
        //
        for (uint32_t i = 1; i < m_numDeclared; i++)
        {
            uint8_t cur = m_sortedEncodings[i];
            uint32_t j = i;
            while (j > 0 && m_info[cur].m_name < m_info[m_sortedEncodings[j - 1]].m_name)
            {
                m_sortedEncodings[j] = m_sortedEncodings[j - 1];
                j--;
            }
            m_sortedEncodings[j] = cur;
        }

        for (uint32_t i = 1; i < m_numDeclared; i++)
        {
            if (m_info[m_sortedEncodings[i]].m_name == m_info[m_sortedEncodings[i - 1]].m_name)
            {
                m_status = WasmOpcodeTableStatus::DuplicateName;
                return;
            }
        }
    }

    constexpr WasmOpcodeTableStatus GetStatus() const
    {
        return m_status;
    }

    // Always succeeds: unassigned encodings map to an ILLEGAL entry
    //
    constexpr const WasmOpcodeInfo& ByCode(uint8_t opcode) const
    {
        ReleaseAssert(m_status == WasmOpcodeTableStatus::OK);
        return m_info[opcode];
    }

    constexpr const WasmOpcodeInfo& ByCode(WasmOpcode opcode) const
    {
        return ByCode(static_cast<uint8_t>(opcode));
    }

    // Exact match only. Returns nullptr if no declared opcode has this mnemonic.
    //
    const WasmOpcodeInfo* TryByName(std::string_view name) const;

    // Same as TryByName, but throws WasmOpcodeNotFound
    //
    const WasmOpcodeInfo& ByName(std::string_view name) const;

    constexpr size_t GetNumDeclaredOpcodes() const
    {
        ReleaseAssert(m_status == WasmOpcodeTableStatus::OK);
        return m_numDeclared;
    }

    // The i-th declared opcode in mnemonic order
    //
    constexpr const WasmOpcodeInfo& GetSortedByName(size_t i) const
    {
        ReleaseAssert(m_status == WasmOpcodeTableStatus::OK && i < m_numDeclared);
        return m_info[m_sortedEncodings[i]];
    }

private:
    WasmOpcodeTableStatus m_status;
    uint16_t m_numDeclared;
    uint8_t m_sortedEncodings[256];
    WasmOpcodeInfo m_info[256];
};

constexpr WasmOpcodeDefinition x_wasmOpcodeDefinitions[] = {
#define F(opcodeName, opcodeEncoding, mnemonic, isSpecial, immType, ...) \
    WasmOpcodeDefinition::Create<immType, __VA_ARGS__>(opcodeEncoding, mnemonic, isSpecial),
FOR_EACH_WASM_OPCODE
#undef F
};

constexpr size_t x_numWasmOpcodes = sizeof(x_wasmOpcodeDefinitions) / sizeof(x_wasmOpcodeDefinitions[0]);

inline constexpr WasmOpcodeInfoTable g_wasmOpcodeInfoTable(x_wasmOpcodeDefinitions, x_numWasmOpcodes);

static_assert(g_wasmOpcodeInfoTable.GetStatus() != WasmOpcodeTableStatus::BadEncoding, "opcode encoding out of range");
static_assert(g_wasmOpcodeInfoTable.GetStatus() != WasmOpcodeTableStatus::DuplicateEncoding, "two opcodes share an encoding");
static_assert(g_wasmOpcodeInfoTable.GetStatus() != WasmOpcodeTableStatus::EmptyName, "opcode without a mnemonic");
static_assert(g_wasmOpcodeInfoTable.GetStatus() != WasmOpcodeTableStatus::DuplicateName, "two opcodes share a mnemonic");

}   // namespace WasmAbi
