#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

import tierlink.api;

using namespace tierlink;

namespace {
const std::vector<std::string> kCanonical = {"Family", "Health", "Growth", "Work"};
}

TEST(CategoryOrder, CanonicalIsFirstAppearance) {
    const std::vector<std::string> items = {"Family", "Health", "Family", "Growth", "Health", "Work"};
    EXPECT_EQ(category::canonical_category_order(items), kCanonical);
    EXPECT_TRUE(category::canonical_category_order(std::vector<std::string>{}).empty());
}

TEST(CategoryOrder, CanonicalOrderEncodesToEmpty) {
    auto same = category::encode_category_order(kCanonical, kCanonical);
    ASSERT_TRUE(same);
    EXPECT_TRUE(same->empty());

    auto none = category::encode_category_order(std::vector<std::string>{}, kCanonical);
    ASSERT_TRUE(none);
    EXPECT_TRUE(none->empty());

    const std::vector<std::string> partial = {"Work", "Family"};
    auto mismatch = category::encode_category_order(partial, kCanonical);
    ASSERT_TRUE(mismatch);
    EXPECT_TRUE(mismatch->empty());
}

TEST(CategoryOrder, EncodesRankBytesOnly) {
    const std::vector<std::string> order = {"Work", "Family", "Growth", "Health"};
    auto frag = category::encode_category_order(order, kCanonical);
    ASSERT_TRUE(frag);
    EXPECT_EQ(*frag, "Ew");   // permutation [3,0,2,1] has rank 19

    auto back = category::decode_category_order(*frag, kCanonical);
    ASSERT_TRUE(back);
    EXPECT_EQ(*back, order);
}

TEST(CategoryOrder, EmptyFragmentMeansCanonical) {
    auto back = category::decode_category_order("", kCanonical);
    ASSERT_TRUE(back);
    EXPECT_EQ(*back, kCanonical);
}

TEST(CategoryOrder, UnknownCategoryFails) {
    const std::vector<std::string> order = {"Work", "Family", "Leisure", "Health"};
    auto r = category::encode_category_order(order, kCanonical);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::CATEGORY_NOT_FOUND);
    EXPECT_NE(r.error().message().find("Leisure"), std::string::npos);
}

TEST(CategoryOrder, CorruptFragmentFails) {
    auto bad = category::decode_category_order("E+", kCanonical);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::MALFORMED_FRAGMENT);

    auto big = category::decode_category_order("GA", kCanonical);   // 24 == 4!
    ASSERT_FALSE(big);
    EXPECT_EQ(big.error().code(), ErrorCode::RANK_OUT_OF_RANGE);
}

TEST(CategoryOrder, EveryReorderingRoundTrips) {
    std::vector<std::string> order = kCanonical;
    std::sort(order.begin(), order.end());
    int seen = 0;
    do {
        auto frag = category::encode_category_order(order, kCanonical);
        ASSERT_TRUE(frag);
        auto back = category::decode_category_order(*frag, kCanonical);
        ASSERT_TRUE(back);
        EXPECT_EQ(*back, order);
        ++seen;
    } while (std::next_permutation(order.begin(), order.end()));
    EXPECT_EQ(seen, 24);
}
