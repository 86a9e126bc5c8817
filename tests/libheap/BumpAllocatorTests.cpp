//
// Unit tests for LibHeap::BumpAllocator
//

#include <TestHarness.h>
#include <HeapArena.h>
#include <libheap/BumpAllocator.h>
#include <cstdint>
#include <vector>

using namespace HeronTest;
using LibHeap::BumpAllocator;

namespace {
    uintptr_t addressOf(const void* ptr) {
        return reinterpret_cast<uintptr_t>(ptr);
    }
}

TEST(Bump_AllocatesSequentiallyFromStart) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    void* a = heap.allocate({16, 8});
    void* b = heap.allocate({16, 8});
    ASSERT_EQ(arena.start(), addressOf(a));
    ASSERT_EQ(arena.start() + 16, addressOf(b));
    ASSERT_EQ(2ul, heap.liveAllocations());
    ASSERT_EQ(arena.size() - 32, heap.freeBytes());
    ASSERT_EQ(arena.start() + 32, heap.cursor());
}

TEST(Bump_RespectsAlignment) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    void* a = heap.allocate({1, 1});
    void* b = heap.allocate({8, 64});
    void* c = heap.allocate({3, 2});
    void* d = heap.allocate({32, 256});
    ASSERT_EQ(arena.start(), addressOf(a));
    ASSERT_EQ(arena.start() + 64, addressOf(b));
    ASSERT_EQ(0ul, addressOf(c) % 2);
    ASSERT_EQ(0ul, addressOf(d) % 256);
    ASSERT_GE(addressOf(c), addressOf(b) + 8);
    ASSERT_GE(addressOf(d), addressOf(c) + 3);
}

TEST(Bump_FailsWhenRegionExhausted) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    void* all = heap.allocate({arena.size(), 1});
    ASSERT_EQ(arena.start(), addressOf(all));
    ASSERT_EQ(0ul, heap.freeBytes());
    ASSERT_EQ(nullptr, heap.allocate({1, 1}));
    ASSERT_EQ(1ul, heap.liveAllocations());
}

TEST(Bump_FailsOnAddressOverflow) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    ASSERT_EQ(nullptr, heap.allocate({static_cast<size_t>(-1), 1}));
    ASSERT_EQ(nullptr, heap.allocate({16, static_cast<size_t>(1) << 63}));
    ASSERT_EQ(0ul, heap.liveAllocations());
    ASSERT_EQ(arena.start(), heap.cursor());
}

TEST(Bump_FreeingLastAllocationReclaimsRegion) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    std::vector<void*> blocks;
    for (size_t i = 0; i < 10; i++) {
        void* ptr = heap.allocate({24, 8});
        ASSERT_NE(nullptr, ptr);
        blocks.push_back(ptr);
    }
    // Free out of order; the cursor only moves once the count reaches zero
    for (size_t i = 0; i < blocks.size(); i += 2) {
        heap.deallocate(blocks[i], {24, 8});
    }
    ASSERT_EQ(5ul, heap.liveAllocations());
    ASSERT_NE(arena.start(), heap.cursor());
    for (size_t i = 1; i < blocks.size(); i += 2) {
        heap.deallocate(blocks[i], {24, 8});
    }

    ASSERT_EQ(0ul, heap.liveAllocations());
    ASSERT_EQ(arena.start(), heap.cursor());
    ASSERT_EQ(arena.size(), heap.freeBytes());
    ASSERT_EQ(arena.start(), addressOf(heap.allocate({arena.size(), 1})));
}

TEST(Bump_DeadBlocksStayUnusableWhileAnyAllocationLives) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    void* first = heap.allocate({2048, 8});
    void* second = heap.allocate({2048, 8});
    ASSERT_NE(nullptr, first);
    ASSERT_NE(nullptr, second);

    heap.deallocate(first, {2048, 8});
    ASSERT_EQ(nullptr, heap.allocate({16, 8}));

    heap.deallocate(second, {2048, 8});
    ASSERT_EQ(arena.start(), addressOf(heap.allocate({16, 8})));
}

TEST(Bump_RejectsNonPowerOfTwoAlignment) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    ASSERT_ASSERTS((void)heap.allocate({8, 3}));
    ASSERT_ASSERTS((void)heap.allocate({8, 0}));
}

TEST(Bump_MoreFreesThanAllocationsAsserts) {
    HeapArena arena(4096);
    BumpAllocator heap;
    heap.init(arena.start(), arena.size());

    ASSERT_ASSERTS(heap.deallocate(reinterpret_cast<void*>(arena.start()), {8, 8}));
}
