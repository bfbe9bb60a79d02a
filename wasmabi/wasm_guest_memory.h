#pragma once

#include "common.h"

#include <stdexcept>
#include <vector>

namespace WasmAbi
{

static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__,
              "guest scalars are little-endian and are copied to the host without byte swapping");

// A guest access outside the linear memory, or a guest address computation that wraps around.
// It is never turned into a WASI errno: it terminates the whole host call.
//
class WasmMemoryAccessFault : public std::runtime_error
{
public:
    WasmMemoryAccessFault(uint64_t addr, uint64_t length, uint64_t memorySize);

    uint64_t GetAddress() const { return m_addr; }
    uint64_t GetLength() const { return m_length; }

private:
    uint64_t m_addr;
    uint64_t m_length;
};

// A guest-relative address of a T inside linear memory.
// It is 4 bytes wide, so a WasmGuestPtr stored in guest memory has the guest's pointer layout.
//
template<typename T>
class WasmGuestPtr
{
public:
    constexpr WasmGuestPtr() : m_addr(0) { }
    constexpr explicit WasmGuestPtr(uint32_t addr) : m_addr(addr) { }

    constexpr uint32_t GetAddress() const { return m_addr; }

    // Address of the i-th T starting at this pointer. Nothing is dereferenced.
    //
    WasmGuestPtr WARN_UNUSED Offset(uint64_t i) const
    {
        uint64_t addr = static_cast<uint64_t>(m_addr) + i * sizeof(T);
        if (unlikely(addr > UINT32_MAX))
        {
            throw WasmMemoryAccessFault(addr, sizeof(T), static_cast<uint64_t>(UINT32_MAX) + 1);
        }
        return WasmGuestPtr(static_cast<uint32_t>(addr));
    }

    template<typename U>
    WasmGuestPtr<U> WARN_UNUSED Cast() const
    {
        return WasmGuestPtr<U>(m_addr);
    }

    constexpr bool operator==(const WasmGuestPtr& other) const { return m_addr == other.m_addr; }
    constexpr bool operator!=(const WasmGuestPtr& other) const { return m_addr != other.m_addr; }

private:
    uint32_t m_addr;
};

static_assert(sizeof(WasmGuestPtr<uint8_t>) == 4, "guest pointers must have the guest's 32-bit layout");
static_assert(std::is_trivially_copyable<WasmGuestPtr<uint64_t>>::value, "guest pointers are copied with memcpy");

// A host view of 'm_length' consecutive T in guest memory.
// Only valid until the memory is grown or destroyed.
//
template<typename T>
struct WasmGuestSlice
{
    const T* m_data;
    uint32_t m_length;

    const T* begin() const { return m_data; }
    const T* end() const { return m_data + m_length; }
    uint32_t size() const { return m_length; }
};

// The bounds-checked accessor to a module instance's linear memory.
// Implementations only provide the bounds check; the typed accessors are built on top of it.
//
class WasmGuestMemory
{
public:
    virtual ~WasmGuestMemory() = default;

    // Returns the host address of guest range [addr, addr + length),
    // or throws WasmMemoryAccessFault if any part of it is outside the memory
    //
    virtual uint8_t* Translate(uint32_t addr, uint64_t length) = 0;

    virtual uint64_t WARN_UNUSED GetSizeInBytes() const = 0;

    template<typename T>
    T WARN_UNUSED Get(WasmGuestPtr<T> ptr)
    {
        static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
        T result;
        memcpy(&result, Translate(ptr.GetAddress(), sizeof(T)), sizeof(T));
        return result;
    }

    template<typename T>
    void Set(WasmGuestPtr<T> ptr, const T& value)
    {
        static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
        memcpy(Translate(ptr.GetAddress(), sizeof(T)), &value, sizeof(T));
    }

    template<typename T>
    WasmGuestSlice<T> WARN_UNUSED GetMany(WasmGuestPtr<T> ptr, uint32_t count)
    {
        static_assert(alignof(T) == 1, "GetMany hands out host pointers, so T must not require alignment");
        uint8_t* p = Translate(ptr.GetAddress(), static_cast<uint64_t>(count) * sizeof(T));
        return WasmGuestSlice<T> { reinterpret_cast<const T*>(p), count };
    }

    template<typename T>
    void SetMany(WasmGuestPtr<T> ptr, const T* values, uint32_t count)
    {
        static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
        uint64_t numBytes = static_cast<uint64_t>(count) * sizeof(T);
        uint8_t* p = Translate(ptr.GetAddress(), numBytes);
        if (numBytes > 0)
        {
            memcpy(p, values, numBytes);
        }
    }
};

// A linear memory owned by the host process, made of 64KiB pages
//
class WasmLinearMemory final : public WasmGuestMemory, NonCopyable, NonMovable
{
public:
    static constexpr uint64_t x_pageSize = 65536;
    static constexpr uint32_t x_maxPages = 65536;

    explicit WasmLinearMemory(uint32_t numInitPages, uint32_t maxPages = x_maxPages);

    uint8_t* Translate(uint32_t addr, uint64_t length) override;

    uint64_t WARN_UNUSED GetSizeInBytes() const override { return m_data.size(); }

    uint32_t GetSizeInPages() const { return static_cast<uint32_t>(m_data.size() / x_pageSize); }

    // Returns the *old* number of pages, or -1 if the memory cannot grow that much
    //
    uint32_t WARN_UNUSED Grow(uint32_t numPages);

private:
    uint32_t m_maxPages;
    std::vector<uint8_t> m_data;
};

}   // namespace WasmAbi
