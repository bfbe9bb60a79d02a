#include "error_context.h"

#include <cstdarg>

namespace WasmAbi
{

namespace
{

thread_local AutoThreadErrorContext* t_currentErrorContext = nullptr;

}   // anonymous namespace

void NO_RETURN ReportAssertionFailure(const char* expr, const char* file, int line)
{
    fprintf(stderr, "[FATAL] Assertion '%s' failed at %s:%d\n", expr, file, line);
    fflush(stderr);
    abort();
}

AutoThreadErrorContext::AutoThreadErrorContext()
    : m_prev(t_currentErrorContext)
    , m_errors()
{
    t_currentErrorContext = this;
}

AutoThreadErrorContext::~AutoThreadErrorContext()
{
    TestAssert(t_currentErrorContext == this);
    t_currentErrorContext = m_prev;
}

std::string AutoThreadErrorContext::GetLastError() const
{
    if (m_errors.empty())
    {
        return std::string();
    }
    return m_errors.back();
}

AutoThreadErrorContext* AutoThreadErrorContext::GetCurrent()
{
    return t_currentErrorContext;
}

namespace internal
{

void ReportError(const char* file, int line, const char* fmt, ...)
{
    char buf[1024];
    va_list args;
    va_start(args, fmt);
    int len = vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (len < 0)
    {
        snprintf(buf, sizeof(buf), "(failed to format error message '%s')", fmt);
    }

    fprintf(stderr, "[ERROR] %s (%s:%d)\n", buf, file, line);

    AutoThreadErrorContext* ctx = AutoThreadErrorContext::GetCurrent();
    if (ctx != nullptr)
    {
        ctx->Append(std::string(buf));
    }
}

}   // namespace internal

}   // namespace WasmAbi
