#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "opcode/wasm_opcode_info.h"
#include "wasi_impl.h"
#include "wasmabi/error_context.h"

using namespace WasmAbi;

namespace
{

void PrintUsage()
{
    printf("usage: wasmabi [--trace] --list\n"
           "       wasmabi [--trace] --code <n>\n"
           "       wasmabi [--trace] --name <mnemonic>\n"
           "       wasmabi [--trace] --echo <args...>\n");
}

int ListOpcodes()
{
    for (size_t i = 0; i < g_wasmOpcodeInfoTable.GetNumDeclaredOpcodes(); i++)
    {
        printf("%s\n", g_wasmOpcodeInfoTable.GetSortedByName(i).ToString().c_str());
    }
    return 0;
}

int QueryByCode(const char* arg)
{
    char* end = nullptr;
    errno = 0;
    unsigned long code = strtoul(arg, &end, 0);
    if (errno != 0 || end == arg || *end != '\0' || code > 255)
    {
        printf("wasmabi: '%s' is not an opcode byte\n", arg);
        return 1;
    }
    const WasmOpcodeInfo& info = g_wasmOpcodeInfoTable.ByCode(static_cast<uint8_t>(code));
    printf("%s\n", info.ToString().c_str());
    return info.m_isValid ? 0 : 1;
}

int QueryByName(const char* arg)
{
    try
    {
        printf("%s\n", g_wasmOpcodeInfoTable.ByName(arg).ToString().c_str());
        return 0;
    }
    catch (const WasmOpcodeNotFound& e)
    {
        printf("wasmabi: %s\n", e.what());
        return 1;
    }
}

// Echoes the arguments back the way a guest would: query the sizes, fetch the
// string table into linear memory, then write it to stdout with one iovec per argument.
//
int Echo(int argc, char** argv, bool trace)
{
    WasiHost::Config config = WasiHost::Config::FromHostProcess(argc, argv, nullptr);
    config.m_traceCalls = trace;
    WasiHost host(std::move(config));

    WasmLinearMemory mem(1);
    WasmGuestPtr<WasiSize> argcPtr(0);
    WasmGuestPtr<WasiSize> bufSizePtr(4);
    if (host.args_sizes_get(mem, argcPtr, bufSizePtr) != WasiErrno::success)
    {
        REPORT_ERR("args_sizes_get failed");
        return 1;
    }

    uint32_t numArgs = mem.Get(argcPtr);
    uint32_t bufSize = mem.Get(bufSizePtr);
    if (numArgs > WasiHost::x_maxIovecsPerCall)
    {
        printf("wasmabi: too many arguments to echo (at most %u)\n", WasiHost::x_maxIovecsPerCall);
        return 1;
    }

    WasmGuestPtr<WasmGuestPtr<uint8_t>> argvPtrs(64);
    WasmGuestPtr<WasiGuestIovec> iovs = argvPtrs.Offset(numArgs).Cast<WasiGuestIovec>();
    WasmGuestPtr<uint8_t> argvBuf = iovs.Offset(numArgs).Cast<uint8_t>();
    uint64_t needed = static_cast<uint64_t>(argvBuf.GetAddress()) + bufSize;
    if (needed > mem.GetSizeInBytes())
    {
        uint64_t numPages = (needed - mem.GetSizeInBytes() + WasmLinearMemory::x_pageSize - 1) / WasmLinearMemory::x_pageSize;
        if (mem.Grow(static_cast<uint32_t>(numPages)) == static_cast<uint32_t>(-1))
        {
            printf("wasmabi: arguments do not fit in guest memory\n");
            return 1;
        }
    }

    if (host.args_get(mem, argvPtrs, argvBuf) != WasiErrno::success)
    {
        REPORT_ERR("args_get failed");
        return 1;
    }

    // Each argument is followed by its NUL in the string table; write it as a line terminator instead
    //
    for (uint32_t i = 0; i < numArgs; i++)
    {
        WasmGuestPtr<uint8_t> str = mem.Get(argvPtrs.Offset(i));
        WasmGuestPtr<uint8_t> next = (i + 1 < numArgs) ? mem.Get(argvPtrs.Offset(i + 1)) : argvBuf.Offset(bufSize);
        WasiSize len = next.GetAddress() - str.GetAddress();
        mem.Set(str.Offset(len - 1), static_cast<uint8_t>('\n'));
        WasiGuestIovec iov;
        iov.m_buf = str;
        iov.m_bufLen = len;
        mem.Set(iovs.Offset(i), iov);
    }

    WasmGuestPtr<WasiSize> nwritten(8);
    WasiErrno err = host.fd_write(mem, static_cast<__wasi_fd_t>(WasiFd::Stdout), iovs, numArgs, nwritten);
    if (err != WasiErrno::success)
    {
        printf("wasmabi: fd_write failed: %s\n", WasiErrnoName(err));
        return 1;
    }
    if (mem.Get(nwritten) != bufSize)
    {
        fprintf(stderr, "[WARNING] [WASI] short write: %u of %u bytes\n", mem.Get(nwritten), bufSize);
    }
    return 0;
}

}   // anonymous namespace

int main(int argc, char **argv)
{
    if (argc <= 1)
    {
        printf("wasmabi: no command\n");
        PrintUsage();
        return 0;
    }

    int argi = 1;
    bool trace = false;
    if (strcmp(argv[argi], "--trace") == 0)
    {
        trace = true;
        argi++;
    }
    if (argi >= argc)
    {
        printf("wasmabi: no command\n");
        PrintUsage();
        return 1;
    }

    const char* cmd = argv[argi];
    argi++;
    try
    {
        if (strcmp(cmd, "--list") == 0 && argi == argc)
        {
            return ListOpcodes();
        }
        if (strcmp(cmd, "--code") == 0 && argi + 1 == argc)
        {
            return QueryByCode(argv[argi]);
        }
        if (strcmp(cmd, "--name") == 0 && argi + 1 == argc)
        {
            return QueryByName(argv[argi]);
        }
        if (strcmp(cmd, "--echo") == 0)
        {
            return Echo(argc - argi, argv + argi, trace);
        }
    }
    catch (const WasmMemoryAccessFault& e)
    {
        printf("wasmabi: guest memory fault: %s\n", e.what());
        return 1;
    }
    catch (const WasiContractViolation& e)
    {
        printf("wasmabi: %s\n", e.what());
        return 1;
    }

    printf("wasmabi: unknown command '%s'\n", cmd);
    PrintUsage();
    return 1;
}
