#pragma once

#include "wasmabi/common.h"

#include <variant>

namespace WasmAbi
{

// The shape of the inline operand following an opcode byte
//
enum class WasmImmediateKind : uint8_t
{
    None,       // has no operands
    TypeTag,    // a block type
    U32,        // one u32 (index, or the value of i32.const)
    MemArg,     // alignment hint + offset
    U32z,       // one u32 followed by a reserved zero byte
    I64,        // i64.const
    F32,        // f32.const
    F64,        // f64.const
    BrTable,    // br_table target list
    X_END_OF_ENUM
};

constexpr const char* WasmImmediateKindName(WasmImmediateKind kind)
{
    switch (kind)
    {
    case WasmImmediateKind::None: return "None";
    case WasmImmediateKind::TypeTag: return "TypeTag";
    case WasmImmediateKind::U32: return "U32";
    case WasmImmediateKind::MemArg: return "MemArg";
    case WasmImmediateKind::U32z: return "U32z";
    case WasmImmediateKind::I64: return "I64";
    case WasmImmediateKind::F32: return "F32";
    case WasmImmediateKind::F64: return "F64";
    case WasmImmediateKind::BrTable: return "BrTable";
    case WasmImmediateKind::X_END_OF_ENUM: break;
    }
    return "(invalid)";
}

// blocktype ::= 0x40 | valtype
//
enum class WasmBlockType : uint8_t
{
    Void = 0x40,
    I32 = 0x7F,
    I64 = 0x7E,
    F32 = 0x7D,
    F64 = 0x7C
};

// One struct per immediate kind. 'x_bytes' is the size reserved for the payload in dispatch storage,
// not the size of its (LEB128) wire encoding.
//
struct WasmImmNone
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::None;
    static constexpr uint8_t x_bytes = 0;
};

struct WasmImmTypeTag
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::TypeTag;
    static constexpr uint8_t x_bytes = 8;

    WasmBlockType m_blockType;
};

struct WasmImmU32
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::U32;
    static constexpr uint8_t x_bytes = 4;

    uint32_t m_value;
};

struct WasmImmMemArg
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::MemArg;
    static constexpr uint8_t x_bytes = 8;

    uint32_t m_offset;
    uint32_t m_alignLog2;
};

struct WasmImmU32z
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::U32z;
    static constexpr uint8_t x_bytes = 5;

    uint32_t m_value;
};

struct WasmImmI64
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::I64;
    static constexpr uint8_t x_bytes = 8;

    int64_t m_value;
};

struct WasmImmF32
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::F32;
    static constexpr uint8_t x_bytes = 4;

    float m_value;
};

struct WasmImmF64
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::F64;
    static constexpr uint8_t x_bytes = 8;

    double m_value;
};

struct WasmImmBrTable
{
    static constexpr WasmImmediateKind x_kind = WasmImmediateKind::BrTable;
    static constexpr uint8_t x_bytes = 8;

    // The targets live in a side table owned by the decoder
    //
    uint32_t m_targetTableOffset;
    uint32_t m_numTargets;
};

// A decoded immediate. The alternative held *is* the kind, so the payload can never be read as the wrong shape.
// The alternatives are in WasmImmediateKind order.
//
using WasmImmediate = std::variant<WasmImmNone,
                                   WasmImmTypeTag,
                                   WasmImmU32,
                                   WasmImmMemArg,
                                   WasmImmU32z,
                                   WasmImmI64,
                                   WasmImmF32,
                                   WasmImmF64,
                                   WasmImmBrTable>;

static_assert(std::variant_size<WasmImmediate>::value == static_cast<size_t>(WasmImmediateKind::X_END_OF_ENUM));

inline WasmImmediateKind WARN_UNUSED GetImmediateKind(const WasmImmediate& imm)
{
    return std::visit([](const auto& alt) { return std::decay_t<decltype(alt)>::x_kind; }, imm);
}

inline uint8_t WARN_UNUSED GetImmediateBytes(const WasmImmediate& imm)
{
    return std::visit([](const auto& alt) { return std::decay_t<decltype(alt)>::x_bytes; }, imm);
}

namespace internal
{

template<size_t idx>
constexpr bool ImmediateAlternativesAreInKindOrder()
{
    if constexpr(idx == std::variant_size<WasmImmediate>::value)
    {
        return true;
    }
    else
    {
        return std::variant_alternative_t<idx, WasmImmediate>::x_kind == static_cast<WasmImmediateKind>(idx) &&
               ImmediateAlternativesAreInKindOrder<idx + 1>();
    }
}

template<size_t idx>
constexpr uint8_t ImmediateBytesImpl(WasmImmediateKind kind)
{
    if constexpr(idx == std::variant_size<WasmImmediate>::value)
    {
        return 0;
    }
    else
    {
        using Alt = std::variant_alternative_t<idx, WasmImmediate>;
        return Alt::x_kind == kind ? Alt::x_bytes : ImmediateBytesImpl<idx + 1>(kind);
    }
}

}   // namespace internal

static_assert(internal::ImmediateAlternativesAreInKindOrder<0>(), "WasmImmediate alternatives out of order");

constexpr uint8_t WasmImmediateKindBytes(WasmImmediateKind kind)
{
    return internal::ImmediateBytesImpl<0>(kind);
}

// A value-initialized immediate of the given kind
//
inline WasmImmediate WARN_UNUSED MakeImmediate(WasmImmediateKind kind)
{
    switch (kind)
    {
    case WasmImmediateKind::None: return WasmImmNone {};
    case WasmImmediateKind::TypeTag: return WasmImmTypeTag { WasmBlockType::Void };
    case WasmImmediateKind::U32: return WasmImmU32 {};
    case WasmImmediateKind::MemArg: return WasmImmMemArg {};
    case WasmImmediateKind::U32z: return WasmImmU32z {};
    case WasmImmediateKind::I64: return WasmImmI64 {};
    case WasmImmediateKind::F32: return WasmImmF32 {};
    case WasmImmediateKind::F64: return WasmImmF64 {};
    case WasmImmediateKind::BrTable: return WasmImmBrTable {};
    case WasmImmediateKind::X_END_OF_ENUM: break;
    }
    ReleaseAssert(false && "invalid immediate kind");
    return WasmImmNone {};
}

}   // namespace WasmAbi
