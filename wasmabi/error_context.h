#pragma once

#include "common.h"

#include <vector>

namespace WasmAbi
{

// Collects the errors reported by REPORT_ERR on the current thread while it is alive.
// Contexts nest: the innermost one receives the messages.
//
class AutoThreadErrorContext : NonCopyable, NonMovable
{
public:
    AutoThreadErrorContext();
    ~AutoThreadErrorContext();

    bool WARN_UNUSED HasError() const { return !m_errors.empty(); }

    const std::vector<std::string>& GetErrors() const { return m_errors; }

    // Returns an empty string if no error has been reported
    //
    std::string WARN_UNUSED GetLastError() const;

    void Clear() { m_errors.clear(); }

    static AutoThreadErrorContext* GetCurrent();

    void Append(std::string message) { m_errors.push_back(std::move(message)); }

private:
    AutoThreadErrorContext* m_prev;
    std::vector<std::string> m_errors;
};

namespace internal
{

void __attribute__((__format__(__printf__, 3, 4))) ReportError(const char* file, int line, const char* fmt, ...);

}   // namespace internal

}   // namespace WasmAbi

#define REPORT_ERR(...) ::WasmAbi::internal::ReportError(__FILE__, __LINE__, __VA_ARGS__)
