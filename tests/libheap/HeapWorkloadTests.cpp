//
// Allocation workloads run against every heap strategy through Locked<>
//

#include <TestHarness.h>
#include <HeapArena.h>
#include <libheap/HeapStrategy.h>
#include <libheap/Locked.h>
#include <libheap/BumpAllocator.h>
#include <libheap/FreeListAllocator.h>
#include <libheap/FixedSizeBlockAllocator.h>
#include <cstdint>
#include <cstring>

using namespace HeronTest;
using LibHeap::AllocationRequest;
using LibHeap::Locked;

namespace {
    constexpr size_t workloadHeapSize = 100 * 1024;
    constexpr AllocationRequest boxRequest{sizeof(uint64_t), alignof(uint64_t)};

    template <LibHeap::HeapStrategy Strategy>
    struct WorkloadHeap {
        HeapArena arena{workloadHeapSize};
        Locked<Strategy> heap;

        WorkloadHeap() {
            heap.acquire()->init(arena.start(), arena.size());
        }

        uint64_t* box(uint64_t value) {
            auto* slot = static_cast<uint64_t*>(heap.acquire()->allocate(boxRequest));
            if (slot != nullptr) {
                *slot = value;
            }
            return slot;
        }

        void unbox(uint64_t* slot) {
            heap.acquire()->deallocate(slot, boxRequest);
        }
    };

    template <LibHeap::HeapStrategy Strategy>
    void simpleAllocation() {
        WorkloadHeap<Strategy> w;
        uint64_t* first = w.box(41);
        uint64_t* second = w.box(13);
        ASSERT_NE(nullptr, first);
        ASSERT_NE(nullptr, second);
        ASSERT_NE(first, second);
        ASSERT_EQ(41ul, *first);
        ASSERT_EQ(13ul, *second);
        w.unbox(first);
        w.unbox(second);
    }

    // Grows an array by doubling, the way a vector reallocates
    template <LibHeap::HeapStrategy Strategy>
    void largeGrowableArray() {
        WorkloadHeap<Strategy> w;
        constexpr size_t count = 1000;
        uint64_t* data = nullptr;
        size_t capacity = 0;
        for (size_t i = 0; i < count; i++) {
            if (i == capacity) {
                const size_t newCapacity = capacity == 0 ? 1 : capacity * 2;
                auto* grown = static_cast<uint64_t*>(
                    w.heap.acquire()->allocate({newCapacity * sizeof(uint64_t), alignof(uint64_t)}));
                ASSERT_NE(nullptr, grown);
                if (data != nullptr) {
                    std::memcpy(grown, data, capacity * sizeof(uint64_t));
                    w.heap.acquire()->deallocate(data, {capacity * sizeof(uint64_t), alignof(uint64_t)});
                }
                data = grown;
                capacity = newCapacity;
            }
            data[i] = i;
        }
        uint64_t sum = 0;
        for (size_t i = 0; i < count; i++) {
            sum += data[i];
        }
        ASSERT_EQ(static_cast<uint64_t>((count - 1) * count / 2), sum);
        w.heap.acquire()->deallocate(data, {capacity * sizeof(uint64_t), alignof(uint64_t)});
    }

    // More allocations than would fit at once; each is freed before the next
    template <LibHeap::HeapStrategy Strategy>
    void manyBoxes() {
        WorkloadHeap<Strategy> w;
        for (uint64_t i = 0; i < workloadHeapSize; i++) {
            uint64_t* slot = w.box(i);
            ASSERT_NE(nullptr, slot);
            ASSERT_EQ(i, *slot);
            w.unbox(slot);
        }
    }

    template <LibHeap::HeapStrategy Strategy>
    void manyBoxesLongLived() {
        WorkloadHeap<Strategy> w;
        uint64_t* longLived = w.box(1);
        ASSERT_NE(nullptr, longLived);
        for (uint64_t i = 0; i < workloadHeapSize; i++) {
            uint64_t* slot = w.box(i);
            ASSERT_NE(nullptr, slot);
            ASSERT_EQ(i, *slot);
            w.unbox(slot);
        }
        ASSERT_EQ(1ul, *longLived);
        w.unbox(longLived);
    }
}

TEST(Workload_Bump_SimpleAllocation) { simpleAllocation<LibHeap::BumpAllocator>(); }
TEST(Workload_Bump_LargeGrowableArray) { largeGrowableArray<LibHeap::BumpAllocator>(); }
TEST(Workload_Bump_ManyBoxes) { manyBoxes<LibHeap::BumpAllocator>(); }

// One live box keeps the bump allocator from ever rewinding, so the loop runs out of space
TEST(Workload_Bump_ManyBoxesLongLivedExhaustsHeap) {
    WorkloadHeap<LibHeap::BumpAllocator> w;
    uint64_t* longLived = w.box(1);
    ASSERT_NE(nullptr, longLived);

    uint64_t firstFailure = 0;
    bool failed = false;
    for (uint64_t i = 0; i < workloadHeapSize; i++) {
        uint64_t* slot = w.box(i);
        if (slot == nullptr) {
            firstFailure = i;
            failed = true;
            break;
        }
        w.unbox(slot);
    }
    ASSERT_TRUE(failed);
    ASSERT_EQ(static_cast<uint64_t>(workloadHeapSize / sizeof(uint64_t) - 1), firstFailure);
    ASSERT_EQ(1ul, *longLived);
}

TEST(Workload_FreeList_SimpleAllocation) { simpleAllocation<LibHeap::FreeListAllocator>(); }
TEST(Workload_FreeList_LargeGrowableArray) { largeGrowableArray<LibHeap::FreeListAllocator>(); }
TEST(Workload_FreeList_ManyBoxes) { manyBoxes<LibHeap::FreeListAllocator>(); }
TEST(Workload_FreeList_ManyBoxesLongLived) { manyBoxesLongLived<LibHeap::FreeListAllocator>(); }

TEST(Workload_FixedBlock_SimpleAllocation) { simpleAllocation<LibHeap::FixedSizeBlockAllocator>(); }
TEST(Workload_FixedBlock_LargeGrowableArray) { largeGrowableArray<LibHeap::FixedSizeBlockAllocator>(); }
TEST(Workload_FixedBlock_ManyBoxes) { manyBoxes<LibHeap::FixedSizeBlockAllocator>(); }
TEST(Workload_FixedBlock_ManyBoxesLongLived) { manyBoxesLongLived<LibHeap::FixedSizeBlockAllocator>(); }
