#include "wasi_impl.h"
#include "wasmabi/error_context.h"

#include <sys/uio.h>
#include <unistd.h>

namespace WasmAbi
{

namespace
{

// Generated code passes every WASI argument in its own 64-bit slot
//
template<typename T, uint32_t ord>
T WasiGetArg(const uint64_t* params)
{
    static_assert(!std::is_pointer<T>::value);
    static_assert(std::is_integral<T>::value && sizeof(T) <= 8);
    return static_cast<T>(params[ord]);
}

template<typename T, uint32_t ord>
WasmGuestPtr<T> WasiGetMemPtrArg(const uint64_t* params)
{
    return WasmGuestPtr<T>(WasiGetArg<uint32_t, ord>(params));
}

uint64_t GetStringTableBufSize(const std::vector<std::string>& strings)
{
    uint64_t result = 0;
    for (const std::string& s : strings)
    {
        result += s.length() + 1;
    }
    return result;
}

uint32_t args_get_thunk(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params)
{
    WasmGuestPtr<WasmGuestPtr<uint8_t>> argv = WasiGetMemPtrArg<WasmGuestPtr<uint8_t>, 0>(params);
    WasmGuestPtr<uint8_t> argvBuf            = WasiGetMemPtrArg<uint8_t,               1>(params);
    return static_cast<uint32_t>(host.args_get(mem, argv, argvBuf));
}

uint32_t args_sizes_get_thunk(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params)
{
    WasmGuestPtr<WasiSize> argc        = WasiGetMemPtrArg<WasiSize, 0>(params);
    WasmGuestPtr<WasiSize> argvBufSize = WasiGetMemPtrArg<WasiSize, 1>(params);
    return static_cast<uint32_t>(host.args_sizes_get(mem, argc, argvBufSize));
}

uint32_t environ_get_thunk(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params)
{
    WasmGuestPtr<WasmGuestPtr<uint8_t>> env = WasiGetMemPtrArg<WasmGuestPtr<uint8_t>, 0>(params);
    WasmGuestPtr<uint8_t> envBuf            = WasiGetMemPtrArg<uint8_t,               1>(params);
    return static_cast<uint32_t>(host.environ_get(mem, env, envBuf));
}

uint32_t environ_sizes_get_thunk(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params)
{
    WasmGuestPtr<WasiSize> envCount   = WasiGetMemPtrArg<WasiSize, 0>(params);
    WasmGuestPtr<WasiSize> envBufSize = WasiGetMemPtrArg<WasiSize, 1>(params);
    return static_cast<uint32_t>(host.environ_sizes_get(mem, envCount, envBufSize));
}

uint32_t fd_write_thunk(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params)
{
    __wasi_fd_t fd                    = WasiGetArg<__wasi_fd_t,          0>(params);
    WasmGuestPtr<WasiGuestIovec> iovs = WasiGetMemPtrArg<WasiGuestIovec, 1>(params);
    WasiSize iovsLen                  = WasiGetArg<WasiSize,             2>(params);
    WasmGuestPtr<WasiSize> nwritten   = WasiGetMemPtrArg<WasiSize,       3>(params);
    return static_cast<uint32_t>(host.fd_write(mem, fd, iovs, iovsLen, nwritten));
}

uint32_t clock_res_get_thunk(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params)
{
    __wasi_clockid_t clockId               = WasiGetArg<__wasi_clockid_t,    0>(params);
    WasmGuestPtr<WasiTimestamp> resolution = WasiGetMemPtrArg<WasiTimestamp, 1>(params);
    return static_cast<uint32_t>(host.clock_res_get(mem, clockId, resolution));
}

uint32_t clock_time_get_thunk(const WasiHost& host, WasmGuestMemory& mem, const uint64_t* params)
{
    __wasi_clockid_t clockId         = WasiGetArg<__wasi_clockid_t,    0>(params);
    WasiTimestamp precision          = WasiGetArg<WasiTimestamp,       1>(params);
    WasmGuestPtr<WasiTimestamp> time = WasiGetMemPtrArg<WasiTimestamp, 2>(params);
    return static_cast<uint32_t>(host.clock_time_get(mem, clockId, precision, time));
}

}   // anonymous namespace

const char* WasiErrnoName(WasiErrno e)
{
    switch (e)
    {
    case WasiErrno::success: return "success";
    case WasiErrno::acces: return "acces";
    case WasiErrno::again: return "again";
    case WasiErrno::badf: return "badf";
    case WasiErrno::dquot: return "dquot";
    case WasiErrno::fbig: return "fbig";
    case WasiErrno::inval: return "inval";
    case WasiErrno::io: return "io";
    case WasiErrno::nobufs: return "nobufs";
    case WasiErrno::nospc: return "nospc";
    case WasiErrno::pipe: return "pipe";
    case WasiErrno::unexpected: return "unexpected";
    }
    return "(invalid)";
}

WasiErrno WasiErrnoFromWriteErrno(int errnum)
{
    switch (errnum)
    {
    case EDQUOT:  return WasiErrno::dquot;
    case EFBIG:   return WasiErrno::fbig;
    case EIO:     return WasiErrno::io;
    case ENOSPC:  return WasiErrno::nospc;
    case EPERM:
    case EACCES:  return WasiErrno::acces;
    case EPIPE:   return WasiErrno::pipe;
    case ENOMEM:
    case ENOBUFS: return WasiErrno::nobufs;
    case EBADF:   return WasiErrno::badf;
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case EAGAIN:  return WasiErrno::again;
    default:      return WasiErrno::unexpected;
    }
}

WasiErrno WasiErrnoFromClockErrno(int errnum)
{
    switch (errnum)
    {
    case EINVAL:  return WasiErrno::inval;
    default:      return WasiErrno::unexpected;
    }
}

WasiTimestamp WasiTimestampFromTimespec(const struct timespec& ts)
{
    return static_cast<WasiTimestamp>(ts.tv_sec) * 1000000000 + static_cast<WasiTimestamp>(ts.tv_nsec);
}

bool TranslateWasiClockId(__wasi_clockid_t clockId, clockid_t* hostClockId)
{
    switch (static_cast<WasiClockId>(clockId))
    {
    case WasiClockId::realtime:           { *hostClockId = CLOCK_REALTIME; return true; }
    case WasiClockId::monotonic:          { *hostClockId = CLOCK_MONOTONIC; return true; }
    case WasiClockId::process_cputime_id: { *hostClockId = CLOCK_PROCESS_CPUTIME_ID; return true; }
    case WasiClockId::thread_cputime_id:  { *hostClockId = CLOCK_THREAD_CPUTIME_ID; return true; }
    }
    return false;
}

const WasiLinkMapping& GetWasiLinkMapping()
{
    static const WasiLinkMapping mapping =
    {
        { { x_wasiModuleName, "args_get" },          &args_get_thunk },
        { { x_wasiModuleName, "args_sizes_get" },    &args_sizes_get_thunk },
        { { x_wasiModuleName, "environ_get" },       &environ_get_thunk },
        { { x_wasiModuleName, "environ_sizes_get" }, &environ_sizes_get_thunk },
        { { x_wasiModuleName, "fd_write" },          &fd_write_thunk },
        { { x_wasiModuleName, "clock_res_get" },     &clock_res_get_thunk },
        { { x_wasiModuleName, "clock_time_get" },    &clock_time_get_thunk }
    };
    return mapping;
}

WasiHost::Config WasiHost::Config::FromHostProcess(int argc, char** argv, char** envp)
{
    Config config;
    for (int i = 0; i < argc; i++)
    {
        config.m_argv.push_back(argv[i]);
    }
    if (envp == nullptr)
    {
        envp = environ;
    }
    if (envp != nullptr)
    {
        for (char** p = envp; *p != nullptr; p++)
        {
            config.m_environ.push_back(*p);
        }
    }
    return config;
}

WasiHost::WasiHost(Config config)
    : m_config(std::move(config))
{
    // The string tables must be describable with 32-bit guest sizes
    //
    ReleaseAssert(m_config.m_argv.size() <= UINT32_MAX && GetStringTableBufSize(m_config.m_argv) <= UINT32_MAX);
    ReleaseAssert(m_config.m_environ.size() <= UINT32_MAX && GetStringTableBufSize(m_config.m_environ) <= UINT32_MAX);
}

WasiErrno WasiHost::StringsGet(WasmGuestMemory& mem,
                               const std::vector<std::string>& strings,
                               WasmGuestPtr<WasmGuestPtr<uint8_t>> target,
                               WasmGuestPtr<uint8_t> targetBuf) const
{
    uint64_t cursor = 0;
    for (size_t i = 0; i < strings.size(); i++)
    {
        const std::string& s = strings[i];
        WasmGuestPtr<uint8_t> dst = targetBuf.Offset(cursor);
        mem.Set(target.Offset(i), dst);
        mem.SetMany(dst, reinterpret_cast<const uint8_t*>(s.data()), static_cast<uint32_t>(s.length()));
        mem.Set(dst.Offset(s.length()), static_cast<uint8_t>(0));
        cursor += s.length() + 1;
    }
    return WasiErrno::success;
}

WasiErrno WasiHost::StringsSizesGet(WasmGuestMemory& mem,
                                    const std::vector<std::string>& strings,
                                    WasmGuestPtr<WasiSize> targetCount,
                                    WasmGuestPtr<WasiSize> targetBufSize) const
{
    mem.Set(targetCount, static_cast<WasiSize>(strings.size()));
    mem.Set(targetBufSize, static_cast<WasiSize>(GetStringTableBufSize(strings)));
    return WasiErrno::success;
}

WasiErrno WasiHost::args_get(WasmGuestMemory& mem,
                             WasmGuestPtr<WasmGuestPtr<uint8_t>> argv,
                             WasmGuestPtr<uint8_t> argvBuf) const
{
    if (m_config.m_traceCalls)
    {
        fprintf(stderr, "[WASI] args_get(argv=%u, argv_buf=%u)\n", argv.GetAddress(), argvBuf.GetAddress());
    }
    return StringsGet(mem, m_config.m_argv, argv, argvBuf);
}

WasiErrno WasiHost::args_sizes_get(WasmGuestMemory& mem,
                                   WasmGuestPtr<WasiSize> argc,
                                   WasmGuestPtr<WasiSize> argvBufSize) const
{
    if (m_config.m_traceCalls)
    {
        fprintf(stderr, "[WASI] args_sizes_get(argc=%u, argv_buf_size=%u)\n", argc.GetAddress(), argvBufSize.GetAddress());
    }
    return StringsSizesGet(mem, m_config.m_argv, argc, argvBufSize);
}

WasiErrno WasiHost::environ_get(WasmGuestMemory& mem,
                                WasmGuestPtr<WasmGuestPtr<uint8_t>> environPtrs,
                                WasmGuestPtr<uint8_t> environBuf) const
{
    if (m_config.m_traceCalls)
    {
        fprintf(stderr, "[WASI] environ_get(environ=%u, environ_buf=%u)\n", environPtrs.GetAddress(), environBuf.GetAddress());
    }
    return StringsGet(mem, m_config.m_environ, environPtrs, environBuf);
}

WasiErrno WasiHost::environ_sizes_get(WasmGuestMemory& mem,
                                      WasmGuestPtr<WasiSize> environCount,
                                      WasmGuestPtr<WasiSize> environBufSize) const
{
    if (m_config.m_traceCalls)
    {
        fprintf(stderr, "[WASI] environ_sizes_get(environ_count=%u, environ_buf_size=%u)\n",
                environCount.GetAddress(), environBufSize.GetAddress());
    }
    return StringsSizesGet(mem, m_config.m_environ, environCount, environBufSize);
}

WasiErrno WasiHost::fd_write(WasmGuestMemory& mem,
                             __wasi_fd_t fd,
                             WasmGuestPtr<WasiGuestIovec> iovs,
                             WasiSize iovsLen,
                             WasmGuestPtr<WasiSize> nwritten) const
{
    if (m_config.m_traceCalls)
    {
        fprintf(stderr, "[WASI] fd_write(fd=%u, iovs=%u, iovs_len=%u, nwritten=%u)\n",
                static_cast<unsigned int>(fd), iovs.GetAddress(), iovsLen, nwritten.GetAddress());
    }

    if (iovsLen > x_maxIovecsPerCall)
    {
        throw WasiContractViolation("fd_write: " + std::to_string(iovsLen) + " iovecs exceed the limit of " +
                                    std::to_string(x_maxIovecsPerCall));
    }

    int hostFd;
    switch (static_cast<WasiFd>(fd))
    {
    case WasiFd::Stdout: { hostFd = m_config.m_stdoutFd; break; }
    case WasiFd::Stderr: { hostFd = m_config.m_stderrFd; break; }
    default:
    {
        fprintf(stderr, "[WARNING] [WASI] fd_write to descriptor %u is not supported, returning badf\n",
                static_cast<unsigned int>(fd));
        return WasiErrno::badf;
    }
    }

    struct iovec hostIovs[x_maxIovecsPerCall];
    for (uint32_t i = 0; i < iovsLen; i++)
    {
        WasiGuestIovec iov = mem.Get(iovs.Offset(i));
        WasmGuestSlice<uint8_t> slice = mem.GetMany(iov.m_buf, iov.m_bufLen);
        hostIovs[i].iov_base = const_cast<uint8_t*>(slice.m_data);
        hostIovs[i].iov_len = slice.m_length;
    }

    ssize_t ret;
    do {
        ret = writev(hostFd, hostIovs, static_cast<int>(iovsLen));
    } while (ret < 0 && errno == EINTR);

    if (ret < 0)
    {
        int errnum = errno;
        WasiErrno result = WasiErrnoFromWriteErrno(errnum);
        if (result == WasiErrno::unexpected)
        {
            REPORT_ERR("fd_write: host write failed with error %d (%s)", errnum, strerror(errnum));
        }
        return result;
    }

    mem.Set(nwritten, static_cast<WasiSize>(ret));
    return WasiErrno::success;
}

WasiErrno WasiHost::ClockQuery(ClockFn fn,
                               WasmGuestMemory& mem,
                               __wasi_clockid_t clockId,
                               WasmGuestPtr<WasiTimestamp> out) const
{
    clockid_t hostClockId;
    if (!TranslateWasiClockId(clockId, &hostClockId))
    {
        return WasiErrno::inval;
    }

    struct timespec ts;
    if (fn(hostClockId, &ts) != 0)
    {
        int errnum = errno;
        WasiErrno result = WasiErrnoFromClockErrno(errnum);
        if (result == WasiErrno::unexpected)
        {
            REPORT_ERR("clock query failed with error %d (%s)", errnum, strerror(errnum));
        }
        return result;
    }

    // A WASI timestamp cannot represent a point before the epoch
    //
    if (ts.tv_sec < 0)
    {
        REPORT_ERR("clock query returned a negative time (%lld s)", static_cast<long long>(ts.tv_sec));
        return WasiErrno::inval;
    }

    mem.Set(out, WasiTimestampFromTimespec(ts));
    return WasiErrno::success;
}

WasiErrno WasiHost::clock_res_get(WasmGuestMemory& mem,
                                  __wasi_clockid_t clockId,
                                  WasmGuestPtr<WasiTimestamp> resolution) const
{
    if (m_config.m_traceCalls)
    {
        fprintf(stderr, "[WASI] clock_res_get(clock_id=%u, resolution=%u)\n",
                static_cast<unsigned int>(clockId), resolution.GetAddress());
    }
    return ClockQuery(m_config.m_clockGetRes, mem, clockId, resolution);
}

WasiErrno WasiHost::clock_time_get(WasmGuestMemory& mem,
                                   __wasi_clockid_t clockId,
                                   WasiTimestamp /*precision*/,
                                   WasmGuestPtr<WasiTimestamp> time) const
{
    if (m_config.m_traceCalls)
    {
        fprintf(stderr, "[WASI] clock_time_get(clock_id=%u, time=%u)\n",
                static_cast<unsigned int>(clockId), time.GetAddress());
    }
    return ClockQuery(m_config.m_clockGetTime, mem, clockId, time);
}

bool WasiHost::Dispatch(std::string_view module,
                        std::string_view name,
                        WasmGuestMemory& mem,
                        const uint64_t* params,
                        uint32_t* result) const
{
    const WasiLinkMapping& mapping = GetWasiLinkMapping();
    auto it = mapping.find(std::make_pair(std::string(module), std::string(name)));
    if (it == mapping.end())
    {
        REPORT_ERR("Unknown WASI import '%.*s.%.*s'",
                   static_cast<int>(module.size()), module.data(), static_cast<int>(name.size()), name.data());
        return false;
    }
    *result = it->second(*this, mem, params);
    return true;
}

}   // namespace WasmAbi
