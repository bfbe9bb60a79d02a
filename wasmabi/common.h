#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#define WARN_UNUSED __attribute__((warn_unused_result))
#define NO_RETURN __attribute__((__noreturn__))

#define unlikely(expr) __builtin_expect(static_cast<bool>(expr), 0)

#define WASMABI_TOKEN_PASTE_IMPL(a, b) a ## b
#define WASMABI_TOKEN_PASTE(a, b) WASMABI_TOKEN_PASTE_IMPL(a, b)

namespace WasmAbi
{

void NO_RETURN ReportAssertionFailure(const char* expr, const char* file, int line);

}   // namespace WasmAbi

// ReleaseAssert is checked in all builds, TestAssert only in debug builds
//
#define ReleaseAssert(expr)                                                         \
    do {                                                                            \
        if (unlikely(!(expr)))                                                      \
        {                                                                           \
            ::WasmAbi::ReportAssertionFailure(#expr, __FILE__, __LINE__);           \
        }                                                                           \
    } while (false)

#ifndef NDEBUG
#define TestAssert(expr) ReleaseAssert(expr)
#else
#define TestAssert(expr) static_cast<void>(0)
#endif

namespace WasmAbi
{

class NonCopyable
{
public:
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

protected:
    constexpr NonCopyable() = default;
    ~NonCopyable() = default;
};

class NonMovable
{
public:
    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;

protected:
    constexpr NonMovable() = default;
    ~NonMovable() = default;
};

namespace internal
{

template<typename Lambda>
class AutoScopeGuard : NonCopyable, NonMovable
{
public:
    explicit AutoScopeGuard(Lambda&& lambda)
        : m_lambda(std::forward<Lambda>(lambda))
    { }

    ~AutoScopeGuard()
    {
        m_lambda();
    }

private:
    Lambda m_lambda;
};

}   // namespace internal

}   // namespace WasmAbi

// Run the statements when the current scope exits
// Usage: Auto(if (!success) { close(fd); });
//
#define Auto(...)                                                                               \
    auto WASMABI_TOKEN_PASTE(x_autoLambda_, __LINE__) = [&]() { __VA_ARGS__; };                   \
    ::WasmAbi::internal::AutoScopeGuard<decltype(WASMABI_TOKEN_PASTE(x_autoLambda_, __LINE__))>  \
        WASMABI_TOKEN_PASTE(x_autoGuard_, __LINE__)(std::move(WASMABI_TOKEN_PASTE(x_autoLambda_, __LINE__)))
