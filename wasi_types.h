#pragma once

#include "wasmabi/common.h"
#include "wasmabi/wasm_guest_memory.h"

#include <cstddef>

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wreserved-id-macro"
#pragma clang diagnostic ignored "-Wc11-extensions"

#include "wasi_core.h"

#pragma clang diagnostic pop

namespace WasmAbi
{

// Error codes returned by the WASI calls. The numbering is the one of wasi_snapshot_preview1.
// 'unexpected' is not a WASI errno: it reports a host failure that has no portable equivalent.
//
enum class WasiErrno : __wasi_errno_t
{
    success = __WASI_ERRNO_SUCCESS,
    acces = __WASI_ERRNO_ACCES,
    again = __WASI_ERRNO_AGAIN,
    badf = __WASI_ERRNO_BADF,
    dquot = __WASI_ERRNO_DQUOT,
    fbig = __WASI_ERRNO_FBIG,
    inval = __WASI_ERRNO_INVAL,
    io = __WASI_ERRNO_IO,
    nobufs = __WASI_ERRNO_NOBUFS,
    nospc = __WASI_ERRNO_NOSPC,
    pipe = __WASI_ERRNO_PIPE,
    unexpected = 0xAAAA
};

// Identifiers for clocks. Any other value is answered with 'inval'.
//
enum class WasiClockId : __wasi_clockid_t
{
    realtime = __WASI_CLOCKID_REALTIME,
    monotonic = __WASI_CLOCKID_MONOTONIC,
    process_cputime_id = __WASI_CLOCKID_PROCESS_CPUTIME_ID,
    thread_cputime_id = __WASI_CLOCKID_THREAD_CPUTIME_ID
};

// The standard descriptors. Other values are valid descriptor numbers with no meaning to this host.
//
enum class WasiFd : __wasi_fd_t
{
    Stdin = 0,
    Stdout = 1,
    Stderr = 2
};

using WasiSize = __wasi_size_t;
using WasiTimestamp = __wasi_timestamp_t;

static_assert(sizeof(WasiSize) == 4 && sizeof(WasiTimestamp) == 8);

//  Member name                Bit in __wasi_rights_t
//
#define FOR_EACH_WASI_RIGHT                                                     \
F( m_fdDatasync,              __WASI_RIGHTS_FD_DATASYNC                     )  \
F( m_fdRead,                  __WASI_RIGHTS_FD_READ                         )  \
F( m_fdSeek,                  __WASI_RIGHTS_FD_SEEK                         )  \
F( m_fdFdstatSetFlags,        __WASI_RIGHTS_FD_FDSTAT_SET_FLAGS             )  \
F( m_fdSync,                  __WASI_RIGHTS_FD_SYNC                         )  \
F( m_fdTell,                  __WASI_RIGHTS_FD_TELL                         )  \
F( m_fdWrite,                 __WASI_RIGHTS_FD_WRITE                        )  \
F( m_fdAdvise,                __WASI_RIGHTS_FD_ADVISE                       )  \
F( m_fdAllocate,              __WASI_RIGHTS_FD_ALLOCATE                     )  \
F( m_pathCreateDirectory,     __WASI_RIGHTS_PATH_CREATE_DIRECTORY           )  \
F( m_pathCreateFile,          __WASI_RIGHTS_PATH_CREATE_FILE                )  \
F( m_pathLinkSource,          __WASI_RIGHTS_PATH_LINK_SOURCE                )  \
F( m_pathLinkTarget,          __WASI_RIGHTS_PATH_LINK_TARGET                )  \
F( m_pathOpen,                __WASI_RIGHTS_PATH_OPEN                       )  \
F( m_fdReaddir,               __WASI_RIGHTS_FD_READDIR                      )  \
F( m_pathReadlink,            __WASI_RIGHTS_PATH_READLINK                   )  \
F( m_pathRenameSource,        __WASI_RIGHTS_PATH_RENAME_SOURCE              )  \
F( m_pathRenameTarget,        __WASI_RIGHTS_PATH_RENAME_TARGET              )  \
F( m_pathFilestatGet,         __WASI_RIGHTS_PATH_FILESTAT_GET               )  \
F( m_pathFilestatSetSize,     __WASI_RIGHTS_PATH_FILESTAT_SET_SIZE          )  \
F( m_pathFilestatSetTimes,    __WASI_RIGHTS_PATH_FILESTAT_SET_TIMES         )  \
F( m_fdFilestatGet,           __WASI_RIGHTS_FD_FILESTAT_GET                 )  \
F( m_fdFilestatSetSize,       __WASI_RIGHTS_FD_FILESTAT_SET_SIZE            )  \
F( m_fdFilestatSetTimes,      __WASI_RIGHTS_FD_FILESTAT_SET_TIMES           )  \
F( m_pathSymlink,             __WASI_RIGHTS_PATH_SYMLINK                    )  \
F( m_pathRemoveDirectory,     __WASI_RIGHTS_PATH_REMOVE_DIRECTORY           )  \
F( m_pathUnlinkFile,          __WASI_RIGHTS_PATH_UNLINK_FILE                )  \
F( m_pollFdReadwrite,         __WASI_RIGHTS_POLL_FD_READWRITE               )  \
F( m_sockShutdown,            __WASI_RIGHTS_SOCK_SHUTDOWN                   )

// File descriptor rights, determining which actions may be performed
//
struct WasiRights
{
#define F(member, bit) bool member;
FOR_EACH_WASI_RIGHT
#undef F

    static constexpr WasiRights None()
    {
        return WasiRights {
#define F(member, bit) false,
FOR_EACH_WASI_RIGHT
#undef F
        };
    }

    static constexpr WasiRights FromBits(__wasi_rights_t bits)
    {
        return WasiRights {
#define F(member, bit) (bits & (bit)) != 0,
FOR_EACH_WASI_RIGHT
#undef F
        };
    }

    constexpr __wasi_rights_t ToBits() const
    {
        __wasi_rights_t result = 0;
#define F(member, bit) if (member) { result |= (bit); }
FOR_EACH_WASI_RIGHT
#undef F
        return result;
    }
};

// The guest's iovec/ciovec: { buf: u32, buf_len: u32 }
//
struct WasiGuestIovec
{
    WasmGuestPtr<uint8_t> m_buf;
    WasiSize m_bufLen;
};

static_assert(sizeof(WasiGuestIovec) == 8, "unexpected size");
static_assert(offsetof(WasiGuestIovec, m_bufLen) == 4, "unexpected layout");

}   // namespace WasmAbi
