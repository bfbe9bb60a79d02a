#include "wasm_guest_memory.h"

#include <algorithm>

namespace WasmAbi
{

namespace
{

std::string FormatAccessFault(uint64_t addr, uint64_t length, uint64_t memorySize)
{
    char buf[160];
    snprintf(buf, sizeof(buf), "guest memory access out of bounds: [0x%llx, +%llu) in memory of %llu bytes",
             static_cast<unsigned long long>(addr),
             static_cast<unsigned long long>(length),
             static_cast<unsigned long long>(memorySize));
    return std::string(buf);
}

}   // anonymous namespace

WasmMemoryAccessFault::WasmMemoryAccessFault(uint64_t addr, uint64_t length, uint64_t memorySize)
    : std::runtime_error(FormatAccessFault(addr, length, memorySize))
    , m_addr(addr)
    , m_length(length)
{ }

WasmLinearMemory::WasmLinearMemory(uint32_t numInitPages, uint32_t maxPages)
    : m_maxPages(std::min(maxPages, x_maxPages))
    , m_data()
{
    ReleaseAssert(numInitPages <= m_maxPages);
    m_data.resize(static_cast<size_t>(numInitPages) * x_pageSize, 0);
}

uint8_t* WasmLinearMemory::Translate(uint32_t addr, uint64_t length)
{
    // 'addr + length' cannot overflow: 'length' is at most 2^32 elements of a small T
    //
    if (unlikely(static_cast<uint64_t>(addr) + length > m_data.size()))
    {
        throw WasmMemoryAccessFault(addr, length, m_data.size());
    }
    return m_data.data() + addr;
}

uint32_t WasmLinearMemory::Grow(uint32_t numPages)
{
    uint32_t oldNumPages = GetSizeInPages();
    if (numPages == 0)
    {
        return oldNumPages;
    }
    if (static_cast<uint64_t>(oldNumPages) + numPages > m_maxPages)
    {
        return static_cast<uint32_t>(-1);
    }
    m_data.resize(static_cast<size_t>(oldNumPages + numPages) * x_pageSize, 0);
    return oldNumPages;
}

}   // namespace WasmAbi
