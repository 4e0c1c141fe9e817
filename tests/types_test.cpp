#include <gtest/gtest.h>

#include "hpkc/core/types.hpp"

TEST(CoreTypes, LiteralExcludesTerminator) {
    const hpkc::core::BufferView v = hpkc::core::literal("HPKE-v1");
    ASSERT_EQ(v.len, 7u);
    EXPECT_EQ(v.data[0], 'H');
    EXPECT_EQ(v.data[6], '1');
    EXPECT_EQ(hpkc::core::literal("").len, 0u);
}
