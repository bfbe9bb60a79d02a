#include "gtest/gtest.h"

#include "wasmabi/wasm_guest_memory.h"

using namespace WasmAbi;

TEST(WasmGuestMemory, PointerArithmetic)
{
    WasmGuestPtr<uint32_t> p(100);
    ReleaseAssert(p.Offset(0) == p);
    ReleaseAssert(p.Offset(3).GetAddress() == 112);
    ReleaseAssert(p.Cast<uint8_t>().Offset(3).GetAddress() == 103);
    ReleaseAssert(WasmGuestPtr<uint64_t>().GetAddress() == 0);

    WasmGuestPtr<uint8_t> top(UINT32_MAX);
    ReleaseAssert(top.Offset(0).GetAddress() == UINT32_MAX);
    EXPECT_THROW({ [[maybe_unused]] auto result = top.Offset(1); }, WasmMemoryAccessFault);
    EXPECT_THROW({ [[maybe_unused]] auto result = WasmGuestPtr<uint64_t>(8).Offset(1ULL << 30); }, WasmMemoryAccessFault);
}

TEST(WasmGuestMemory, GetSet)
{
    WasmLinearMemory mem(1);
    ReleaseAssert(mem.GetSizeInBytes() == 65536);
    ReleaseAssert(mem.GetSizeInPages() == 1);

    WasmGuestPtr<uint64_t> p(8);
    ReleaseAssert(mem.Get(p) == 0);
    mem.Set(p, static_cast<uint64_t>(0x1122334455667788ULL));
    ReleaseAssert(mem.Get(p) == 0x1122334455667788ULL);

    // little-endian guest layout
    //
    ReleaseAssert(mem.Get(WasmGuestPtr<uint8_t>(8)) == 0x88);
    ReleaseAssert(mem.Get(WasmGuestPtr<uint8_t>(15)) == 0x11);

    // unaligned access is allowed
    //
    WasmGuestPtr<uint32_t> q(3);
    mem.Set(q, 0xdeadbeefU);
    ReleaseAssert(mem.Get(q) == 0xdeadbeefU);

    const uint8_t bytes[] = { 'h', 'e', 'l', 'l', 'o' };
    WasmGuestPtr<uint8_t> s(1000);
    mem.SetMany(s, bytes, 5);
    WasmGuestSlice<uint8_t> slice = mem.GetMany(s, 5);
    ReleaseAssert(slice.size() == 5);
    ReleaseAssert(std::string(slice.begin(), slice.end()) == "hello");

    WasmGuestPtr<WasmGuestPtr<uint8_t>> pp(2000);
    mem.Set(pp, s);
    ReleaseAssert(mem.Get(pp) == s);
    ReleaseAssert(mem.Get(pp.Cast<uint32_t>()) == 1000);
}

TEST(WasmGuestMemory, OutOfBounds)
{
    WasmLinearMemory mem(1);

    ReleaseAssert(mem.Get(WasmGuestPtr<uint32_t>(65532)) == 0);
    EXPECT_THROW({ [[maybe_unused]] auto result = mem.Get(WasmGuestPtr<uint32_t>(65533)); }, WasmMemoryAccessFault);
    EXPECT_THROW(mem.Set(WasmGuestPtr<uint8_t>(65536), static_cast<uint8_t>(1)), WasmMemoryAccessFault);
    EXPECT_THROW({ [[maybe_unused]] auto result = mem.GetMany(WasmGuestPtr<uint8_t>(65000), 1000); }, WasmMemoryAccessFault);
    EXPECT_THROW({ [[maybe_unused]] auto result = mem.Get(WasmGuestPtr<uint8_t>(UINT32_MAX)); }, WasmMemoryAccessFault);

    // an empty range at the very end is in bounds
    //
    ReleaseAssert(mem.GetMany(WasmGuestPtr<uint8_t>(65536), 0).size() == 0);

    try
    {
        [[maybe_unused]] auto result = mem.Get(WasmGuestPtr<uint64_t>(65530));
        ReleaseAssert(false);
    }
    catch (const WasmMemoryAccessFault& e)
    {
        ReleaseAssert(e.GetAddress() == 65530);
        ReleaseAssert(e.GetLength() == 8);
    }

    WasmLinearMemory empty(0);
    ReleaseAssert(empty.GetSizeInBytes() == 0);
    EXPECT_THROW({ [[maybe_unused]] auto result = empty.Get(WasmGuestPtr<uint8_t>(0)); }, WasmMemoryAccessFault);
}

TEST(WasmGuestMemory, Grow)
{
    WasmLinearMemory mem(1, 3);
    mem.Set(WasmGuestPtr<uint32_t>(16), 42U);

    ReleaseAssert(mem.Grow(0) == 1);
    ReleaseAssert(mem.Grow(1) == 1);
    ReleaseAssert(mem.GetSizeInPages() == 2);
    ReleaseAssert(mem.Get(WasmGuestPtr<uint32_t>(16)) == 42);
    ReleaseAssert(mem.Get(WasmGuestPtr<uint32_t>(65536 + 16)) == 0);

    ReleaseAssert(mem.Grow(2) == static_cast<uint32_t>(-1));
    ReleaseAssert(mem.GetSizeInPages() == 2);
    ReleaseAssert(mem.Grow(1) == 2);
    ReleaseAssert(mem.GetSizeInBytes() == 3 * WasmLinearMemory::x_pageSize);
    ReleaseAssert(mem.Grow(1) == static_cast<uint32_t>(-1));
}
