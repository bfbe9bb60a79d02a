#pragma once

#include "wasmabi/common.h"

namespace WasmAbi
{

// The runtime type of a value on the operand stack. Void means 'no value'.
//
enum class WasmStackEffect : uint8_t
{
    Void,
    I32,
    I64,
    F32,
    F64,
    X_END_OF_ENUM
};

constexpr const char* WasmStackEffectName(WasmStackEffect e)
{
    switch (e)
    {
    case WasmStackEffect::Void: return "Void";
    case WasmStackEffect::I32: return "I32";
    case WasmStackEffect::I64: return "I64";
    case WasmStackEffect::F32: return "F32";
    case WasmStackEffect::F64: return "F64";
    case WasmStackEffect::X_END_OF_ENUM: break;
    }
    return "(invalid)";
}

template<typename T>
struct IsWasmStackType : std::false_type { };

template<> struct IsWasmStackType<void> : std::true_type { };
template<> struct IsWasmStackType<int32_t> : std::true_type { };
template<> struct IsWasmStackType<int64_t> : std::true_type { };
template<> struct IsWasmStackType<float> : std::true_type { };
template<> struct IsWasmStackType<double> : std::true_type { };

template<typename T>
struct WasmStackEffectOf
{
    static_assert(IsWasmStackType<T>::value, "unsupported operand type: must be one of void, int32_t, int64_t, float, double");
};

template<> struct WasmStackEffectOf<void> { static constexpr WasmStackEffect value = WasmStackEffect::Void; };
template<> struct WasmStackEffectOf<int32_t> { static constexpr WasmStackEffect value = WasmStackEffect::I32; };
template<> struct WasmStackEffectOf<int64_t> { static constexpr WasmStackEffect value = WasmStackEffect::I64; };
template<> struct WasmStackEffectOf<float> { static constexpr WasmStackEffect value = WasmStackEffect::F32; };
template<> struct WasmStackEffectOf<double> { static constexpr WasmStackEffect value = WasmStackEffect::F64; };

// Derives the stack effect of an opcode from the signature of a function implementing it:
// the parameters are the popped operands (in operand order), the return value is the pushed result.
//
template<typename Sig>
struct WasmStackSignature;

template<typename R>
struct WasmStackSignature<R()>
{
    static constexpr WasmStackEffect x_push = WasmStackEffectOf<R>::value;
    static constexpr WasmStackEffect x_pop0 = WasmStackEffect::Void;
    static constexpr WasmStackEffect x_pop1 = WasmStackEffect::Void;
};

template<typename R, typename A>
struct WasmStackSignature<R(A)>
{
    static constexpr WasmStackEffect x_push = WasmStackEffectOf<R>::value;
    static constexpr WasmStackEffect x_pop0 = WasmStackEffectOf<A>::value;
    static constexpr WasmStackEffect x_pop1 = WasmStackEffect::Void;
};

template<typename R, typename A, typename B>
struct WasmStackSignature<R(A, B)>
{
    static constexpr WasmStackEffect x_push = WasmStackEffectOf<R>::value;
    static constexpr WasmStackEffect x_pop0 = WasmStackEffectOf<A>::value;
    static constexpr WasmStackEffect x_pop1 = WasmStackEffectOf<B>::value;
};

template<typename R, typename A, typename B, typename C, typename... Rest>
struct WasmStackSignature<R(A, B, C, Rest...)>
{
    static_assert(!std::is_same<R, R>::value, "an opcode may pop at most two fixed operands");
};

}   // namespace WasmAbi
