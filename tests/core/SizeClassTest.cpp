//
// Unit tests for the size class jump table
//

#include <TestHarness.h>
#include <core/SizeClass.h>
#include <cstddef>

using namespace HeronTest;

namespace {
    constexpr ConstexprArray<size_t, 9> powerOfTwoClasses{{8, 16, 32, 64, 128, 256, 512, 1024, 2048}};
    constexpr ConstexprArray<size_t, 4> unevenClasses{{24, 48, 100, 3000}};
}

static_assert(sizeClassIndex<powerOfTwoClasses>(2048) == 8);
static_assert(sizeClassIndex<powerOfTwoClasses>(2049) == sizeClassNpos);
static_assert(sizeClassIndex<unevenClasses>(49) == 2);

TEST(SizeClass_PowerOfTwoBoundaries) {
    ASSERT_EQ(0ul, sizeClassIndex<powerOfTwoClasses>(0));
    ASSERT_EQ(0ul, sizeClassIndex<powerOfTwoClasses>(1));
    ASSERT_EQ(0ul, sizeClassIndex<powerOfTwoClasses>(8));
    ASSERT_EQ(1ul, sizeClassIndex<powerOfTwoClasses>(9));
    ASSERT_EQ(1ul, sizeClassIndex<powerOfTwoClasses>(10));
    ASSERT_EQ(1ul, sizeClassIndex<powerOfTwoClasses>(16));
    ASSERT_EQ(2ul, sizeClassIndex<powerOfTwoClasses>(17));
    ASSERT_EQ(7ul, sizeClassIndex<powerOfTwoClasses>(1024));
    ASSERT_EQ(8ul, sizeClassIndex<powerOfTwoClasses>(1025));
    ASSERT_EQ(8ul, sizeClassIndex<powerOfTwoClasses>(2048));
}

TEST(SizeClass_TooLargeReturnsNpos) {
    ASSERT_EQ(sizeClassNpos, sizeClassIndex<powerOfTwoClasses>(2049));
    ASSERT_EQ(sizeClassNpos, sizeClassIndex<powerOfTwoClasses>(4096));
    ASSERT_EQ(sizeClassNpos, sizeClassIndex<powerOfTwoClasses>(static_cast<size_t>(-1)));
}

TEST(SizeClass_UnevenClassSizes) {
    ASSERT_EQ(0ul, sizeClassIndex<unevenClasses>(0));
    ASSERT_EQ(0ul, sizeClassIndex<unevenClasses>(1));
    ASSERT_EQ(0ul, sizeClassIndex<unevenClasses>(24));
    ASSERT_EQ(1ul, sizeClassIndex<unevenClasses>(25));
    ASSERT_EQ(1ul, sizeClassIndex<unevenClasses>(40));
    ASSERT_EQ(1ul, sizeClassIndex<unevenClasses>(48));
    ASSERT_EQ(2ul, sizeClassIndex<unevenClasses>(49));
    ASSERT_EQ(2ul, sizeClassIndex<unevenClasses>(100));
    ASSERT_EQ(3ul, sizeClassIndex<unevenClasses>(101));
    ASSERT_EQ(3ul, sizeClassIndex<unevenClasses>(2049));
    ASSERT_EQ(3ul, sizeClassIndex<unevenClasses>(3000));
    ASSERT_EQ(sizeClassNpos, sizeClassIndex<unevenClasses>(3001));
    ASSERT_EQ(sizeClassNpos, sizeClassIndex<unevenClasses>(4096));
}

TEST(SizeClass_EverySizeMapsToSmallestFittingClass) {
    for (size_t size = 1; size <= 2048; size++) {
        const size_t index = sizeClassIndex<powerOfTwoClasses>(size);
        ASSERT_NE(sizeClassNpos, index);
        ASSERT_LE(size, powerOfTwoClasses[index]);
        if (index > 0) {
            ASSERT_GT(size, powerOfTwoClasses[index - 1]);
        }
    }
}
