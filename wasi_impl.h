#pragma once

#include "wasi_types.h"

#include <ctime>
#include <map>
#include <stdexcept>
#include <vector>

namespace WasmAbi
{

// The guest broke a precondition of a WASI call that this host cannot service
// (e.g. more iovecs than x_maxIovecsPerCall). Like WasmMemoryAccessFault, it terminates the call.
//
class WasiContractViolation : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The host side of the WASI calls. Every handler answers one guest call synchronously:
// it reads its arguments from and writes its results into guest memory, and returns a WasiErrno.
// Guest memory faults are not WASI errors and propagate as WasmMemoryAccessFault.
//
// The only state is the immutable Config, so concurrent calls are safe as long as the
// embedder serializes writes to the underlying host descriptors.
//
class WasiHost : NonCopyable, NonMovable
{
public:
    using ClockFn = int(*)(clockid_t, struct timespec*);

    static constexpr uint32_t x_maxIovecsPerCall = 128;

    struct Config
    {
        Config()
            : m_argv()
            , m_environ()
            , m_stdoutFd(1)
            , m_stderrFd(2)
            , m_clockGetTime(&clock_gettime)
            , m_clockGetRes(&clock_getres)
            , m_traceCalls(false)
        { }

        // Captures the command line and environment of the running process.
        // If 'envp' is nullptr, the process environment ('environ') is used.
        //
        static Config WARN_UNUSED FromHostProcess(int argc, char** argv, char** envp);

        std::vector<std::string> m_argv;
        std::vector<std::string> m_environ;

        // Host descriptors backing the guest's stdout and stderr
        //
        int m_stdoutFd;
        int m_stderrFd;

        ClockFn m_clockGetTime;
        ClockFn m_clockGetRes;

        // Print a line to stderr on every WASI call
        //
        bool m_traceCalls;
    };

    explicit WasiHost(Config config);

    const Config& GetConfig() const { return m_config; }

    // Writes one guest pointer per argument into 'argv', each pointing at the argument's copy in 'argvBuf'.
    // The copies are laid out back to back, each followed by a NUL byte.
    //
    WasiErrno WARN_UNUSED args_get(WasmGuestMemory& mem,
                                   WasmGuestPtr<WasmGuestPtr<uint8_t>> argv,
                                   WasmGuestPtr<uint8_t> argvBuf) const;

    // argc is # of arguments, argv_buf_size is total size of all arguments (including trailing '\0')
    //
    WasiErrno WARN_UNUSED args_sizes_get(WasmGuestMemory& mem,
                                         WasmGuestPtr<WasiSize> argc,
                                         WasmGuestPtr<WasiSize> argvBufSize) const;

    WasiErrno WARN_UNUSED environ_get(WasmGuestMemory& mem,
                                      WasmGuestPtr<WasmGuestPtr<uint8_t>> environPtrs,
                                      WasmGuestPtr<uint8_t> environBuf) const;

    WasiErrno WARN_UNUSED environ_sizes_get(WasmGuestMemory& mem,
                                            WasmGuestPtr<WasiSize> environCount,
                                            WasmGuestPtr<WasiSize> environBufSize) const;

    // Gathers the guest buffers into one host writev. Only stdout and stderr can be written;
    // any other descriptor gets 'badf'.
    //
    WasiErrno WARN_UNUSED fd_write(WasmGuestMemory& mem,
                                   __wasi_fd_t fd,
                                   WasmGuestPtr<WasiGuestIovec> iovs,
                                   WasiSize iovsLen,
                                   WasmGuestPtr<WasiSize> nwritten) const;

    WasiErrno WARN_UNUSED clock_res_get(WasmGuestMemory& mem,
                                        __wasi_clockid_t clockId,
                                        WasmGuestPtr<WasiTimestamp> resolution) const;

    // 'precision' is part of the ABI but does not change the result
    //
    WasiErrno WARN_UNUSED clock_time_get(WasmGuestMemory& mem,
                                         __wasi_clockid_t clockId,
                                         WasiTimestamp precision,
                                         WasmGuestPtr<WasiTimestamp> time) const;

    // Invokes the import '<module>.<name>' with raw 64-bit argument slots.
    // Returns false if it is not a WASI call this host provides.
    //
    bool WARN_UNUSED Dispatch(std::string_view module,
                              std::string_view name,
                              WasmGuestMemory& mem,
                              const uint64_t* params,
                              uint32_t* result) const;

private:
    WasiErrno WARN_UNUSED StringsGet(WasmGuestMemory& mem,
                                     const std::vector<std::string>& strings,
                                     WasmGuestPtr<WasmGuestPtr<uint8_t>> target,
                                     WasmGuestPtr<uint8_t> targetBuf) const;

    WasiErrno WARN_UNUSED StringsSizesGet(WasmGuestMemory& mem,
                                          const std::vector<std::string>& strings,
                                          WasmGuestPtr<WasiSize> targetCount,
                                          WasmGuestPtr<WasiSize> targetBufSize) const;

    WasiErrno WARN_UNUSED ClockQuery(ClockFn fn,
                                     WasmGuestMemory& mem,
                                     __wasi_clockid_t clockId,
                                     WasmGuestPtr<WasiTimestamp> out) const;

    const Config m_config;
};

constexpr const char* x_wasiModuleName = "wasi_snapshot_preview1";

// A WASI import as called by generated code: arguments are passed as 64-bit slots, the result is the errno
//
using WasiImportFn = uint32_t(*)(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params);

using WasiLinkMapping = std::map<std::pair<std::string, std::string>, WasiImportFn>;

const WasiLinkMapping& GetWasiLinkMapping();

const char* WasiErrnoName(WasiErrno e);

// Maps the errno of a failed host write to the closest WASI errno
//
WasiErrno WARN_UNUSED WasiErrnoFromWriteErrno(int errnum);

// Maps the errno of a failed clock_gettime/clock_getres to the closest WASI errno
//
WasiErrno WARN_UNUSED WasiErrnoFromClockErrno(int errnum);

// 'ts' must not be before the epoch
//
WasiTimestamp WARN_UNUSED WasiTimestampFromTimespec(const struct timespec& ts);

// Returns false for clock ids that have no host counterpart
//
bool WARN_UNUSED TranslateWasiClockId(__wasi_clockid_t clockId, clockid_t* hostClockId);

}   // namespace WasmAbi
