#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

import tierlink.api;

using namespace tierlink;

namespace {

// Random tier state over n items: shuffled indices dealt into very, somewhat,
// not_ and an unlisted remainder, any of which may be empty.
TierState random_state(std::size_t n, std::mt19937& rng) {
    std::vector<Index> all(n);
    std::iota(all.begin(), all.end(), Index{0});
    std::shuffle(all.begin(), all.end(), rng);

    std::uniform_int_distribution<std::size_t> cut(0, n);
    std::size_t a = cut(rng), b = cut(rng), c = cut(rng);
    if (a > b) std::swap(a, b);
    if (b > c) std::swap(b, c);
    if (a > b) std::swap(a, b);

    TierState s;
    s.very.assign(all.begin(), all.begin() + a);
    s.somewhat.assign(all.begin() + a, all.begin() + b);
    s.not_.assign(all.begin() + b, all.begin() + c);
    return s;
}

// What decoding must return: unlisted indices appended to not_ ascending.
TierState canonical(TierState s, std::size_t n) {
    std::vector<bool> listed(n, false);
    for (const auto* list : {&s.very, &s.somewhat, &s.not_})
        for (Index i : *list) listed[static_cast<std::size_t>(i)] = true;
    for (std::size_t i = 0; i < n; ++i)
        if (!listed[i]) s.not_.push_back(static_cast<Index>(i));
    return s;
}

std::string fragment_of(const Bytes& raw) { return "#" + b64url::encode(raw); }

} // namespace

TEST(TierCodec, ConcreteExample) {
    TierState s;
    s.very = {3, 1};
    s.somewhat = {7};
    s.not_ = {0};

    auto canon = codec::canonicalize_to_permutation(s, 10);
    ASSERT_TRUE(canon);
    EXPECT_EQ(canon->perm, (Permutation{3, 1, 7, 0, 2, 4, 5, 6, 8, 9}));
    EXPECT_EQ(canon->k1, 2u);
    EXPECT_EQ(canon->k2, 1u);

    auto raw = codec::encode_permutation_to_bytes(canon->perm, canon->k1, canon->k2);
    ASSERT_TRUE(raw);
    EXPECT_EQ(*raw, (Bytes{0x01, 0x00, 0x02, 0x00, 0x01, 0x11, 0x9C, 0x70}));

    auto frag = codec::encode_tier_state(s, 10);
    ASSERT_TRUE(frag);
    EXPECT_EQ(*frag, "#AQACAAERnHA");

    auto back = codec::decode_tier_state(*frag, 10);
    ASSERT_TRUE(back);
    EXPECT_EQ(back->very, (std::vector<Index>{3, 1}));
    EXPECT_EQ(back->somewhat, (std::vector<Index>{7}));
    EXPECT_EQ(back->not_, (std::vector<Index>{0, 2, 4, 5, 6, 8, 9}));
}

TEST(TierCodec, RoundTripRandomStates) {
    std::mt19937 rng(20240611u);
    for (std::size_t n : {1u, 2u, 5u, 50u, 200u, 1000u}) {
        for (int trial = 0; trial < 20; ++trial) {
            const TierState s = random_state(n, rng);
            auto frag = codec::encode_tier_state(s, n);
            ASSERT_TRUE(frag) << frag.error().to_string();
            auto back = codec::decode_tier_state(*frag, n);
            ASSERT_TRUE(back) << back.error().to_string();
            EXPECT_EQ(*back, canonical(s, n)) << "n=" << n << " trial=" << trial;
        }
    }
}

TEST(TierCodec, RoundTripWithOneGroupHoldingEverything) {
    constexpr std::size_t n = 50;
    std::vector<Index> rev(n);
    std::iota(rev.rbegin(), rev.rend(), Index{0});

    for (int which = 0; which < 3; ++which) {
        TierState s;
        (which == 0 ? s.very : which == 1 ? s.somewhat : s.not_) = rev;
        auto frag = codec::encode_tier_state(s, n);
        ASSERT_TRUE(frag);
        auto back = codec::decode_tier_state(*frag, n);
        ASSERT_TRUE(back);
        EXPECT_EQ(*back, s);
    }
}

TEST(TierCodec, EncodingIsDeterministic) {
    std::mt19937 rng(7u);
    const TierState s = random_state(200, rng);
    auto a = codec::encode_tier_state(s, 200);
    auto b = codec::encode_tier_state(s, 200);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(*a, *b);
}

TEST(TierCodec, UnlistedIndicesCanonicalizeIntoNot) {
    TierState implicit;
    implicit.very = {2};
    implicit.not_ = {0};

    TierState explicit_state;
    explicit_state.very = {2};
    explicit_state.not_ = {0, 1};

    auto a = codec::encode_tier_state(implicit, 3);
    auto b = codec::encode_tier_state(explicit_state, 3);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(*a, *b);
    EXPECT_EQ(*a, "#AQABAAAE");
}

TEST(TierCodec, MinimalSingleItem) {
    TierState s;
    s.very = {0};
    auto frag = codec::encode_tier_state(s, 1);
    ASSERT_TRUE(frag);
    EXPECT_EQ(*frag, "#AQABAAAA");   // header + single zero rank byte

    auto back = codec::decode_tier_state(*frag, 1);
    ASSERT_TRUE(back);
    EXPECT_EQ(back->very, (std::vector<Index>{0}));
    EXPECT_TRUE(back->somewhat.empty());
    EXPECT_TRUE(back->not_.empty());
}

TEST(TierCodec, LargestNIdentity) {
    constexpr std::size_t n = 65535;
    auto frag = codec::encode_tier_state(TierState{}, n);
    ASSERT_TRUE(frag);
    EXPECT_EQ(*frag, "#AQAAAAAA");

    auto back = codec::decode_tier_state(*frag, n);
    ASSERT_TRUE(back);
    ASSERT_EQ(back->not_.size(), n);
    EXPECT_TRUE(std::is_sorted(back->not_.begin(), back->not_.end()));
    EXPECT_EQ(back->not_.front(), 0);
    EXPECT_EQ(back->not_.back(), static_cast<Index>(n - 1));
}

TEST(TierCodec, MarkerIsOptional) {
    codec::EncodeOptions bare;
    bare.with_marker = false;
    TierState s;
    s.very = {2};
    auto frag = codec::encode_tier_state(s, 3, bare);
    ASSERT_TRUE(frag);
    EXPECT_EQ(*frag, "AQABAAAE");

    auto with = codec::decode_tier_state("#AQABAAAE", 3);
    auto without = codec::decode_tier_state("AQABAAAE", 3);
    ASSERT_TRUE(with);
    ASSERT_TRUE(without);
    EXPECT_EQ(*with, *without);
}

TEST(TierCodec, RejectsBadItemCount) {
    auto zero = codec::encode_tier_state(TierState{}, 0);
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().code(), ErrorCode::INVALID_ITEM_COUNT);
    EXPECT_TRUE(zero.error().is_caller_error());

    EXPECT_EQ(codec::encode_tier_state(TierState{}, 65536).error().code(), ErrorCode::INVALID_ITEM_COUNT);
    EXPECT_EQ(codec::decode_tier_state("#AQAAAAAA", 0).error().code(), ErrorCode::INVALID_ITEM_COUNT);
    EXPECT_EQ(codec::decode_tier_state("#AQAAAAAA", 70000).error().code(), ErrorCode::INVALID_ITEM_COUNT);
}

TEST(TierCodec, RejectsOutOfRangeAndDuplicateIndices) {
    TierState out_of_range;
    out_of_range.somewhat = {1, 10};
    auto r = codec::encode_tier_state(out_of_range, 10);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_NE(r.error().message().find("somewhat"), std::string::npos);

    TierState negative;
    negative.very = {-1};
    EXPECT_EQ(codec::encode_tier_state(negative, 10).error().code(), ErrorCode::INDEX_OUT_OF_RANGE);

    TierState within;
    within.not_ = {4, 4};
    EXPECT_EQ(codec::encode_tier_state(within, 10).error().code(), ErrorCode::DUPLICATE_INDEX);

    TierState across;
    across.very = {3};
    across.somewhat = {3};
    auto d = codec::encode_tier_state(across, 10);
    ASSERT_FALSE(d);
    EXPECT_EQ(d.error().code(), ErrorCode::DUPLICATE_INDEX);
    EXPECT_NE(d.error().message().find("'somewhat'"), std::string::npos);
    EXPECT_NE(d.error().message().find("'very'"), std::string::npos);
}

TEST(TierCodec, EncodeBytesRejectsBadCutPoints) {
    const Permutation perm = {0, 1, 2};
    auto r = codec::encode_permutation_to_bytes(perm, 2, 2);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_CUT_POINTS);

    auto bad = codec::encode_permutation_to_bytes(Permutation{0, 0, 2}, 0, 0);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code(), ErrorCode::INVALID_PERMUTATION);
}

TEST(TierCodec, CorruptVersion) {
    auto r = codec::decode_tier_state(fragment_of({0x02, 0, 0, 0, 0, 0}), 3);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::UNSUPPORTED_VERSION);
    EXPECT_TRUE(r.error().is_format_error());
}

TEST(TierCodec, CorruptCutPoints) {
    auto r = codec::decode_tier_state(fragment_of({0x01, 0, 2, 0, 2, 0}), 3);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_CUT_POINTS);
}

TEST(TierCodec, RankAtOrAboveFactorial) {
    auto last = codec::decode_tier_state(fragment_of({0x01, 0, 0, 0, 0, 5}), 3);
    ASSERT_TRUE(last);
    EXPECT_EQ(last->not_, (std::vector<Index>{2, 1, 0}));

    auto r = codec::decode_tier_state(fragment_of({0x01, 0, 0, 0, 0, 6}), 3);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::RANK_OUT_OF_RANGE);

    auto huge = codec::decode_tier_state(fragment_of({0x01, 0, 0, 0, 0, 0xFF, 0xFF, 0xFF}), 5);
    ASSERT_FALSE(huge);
    EXPECT_EQ(huge.error().code(), ErrorCode::RANK_OUT_OF_RANGE);
}

TEST(TierCodec, MalformedText) {
    for (const char* text : {"#AQ*AAAA", "#AQAA AAA", "#A", "#AQ+AAAAA", "##AQAAAAAA"}) {
        auto r = codec::decode_tier_state(text, 3);
        ASSERT_FALSE(r) << text;
        EXPECT_EQ(r.error().code(), ErrorCode::MALFORMED_FRAGMENT) << text;
    }
}

TEST(TierCodec, ShortBuffer) {
    for (const char* text : {"", "#", "#AQ", "#AQAAAA"}) {
        auto r = codec::decode_tier_state(text, 3);
        ASSERT_FALSE(r) << text;
        EXPECT_EQ(r.error().code(), ErrorCode::FRAGMENT_TOO_SHORT) << text;
    }
}

TEST(TierCodec, NonMinimalRankBytes) {
    const std::string padded = fragment_of({0x01, 0, 0, 0, 0, 0x00, 0x05});
    const std::string missing = fragment_of({0x01, 0, 0, 0, 0});

    auto lenient = codec::decode_tier_state(padded, 3);
    ASSERT_TRUE(lenient);
    EXPECT_EQ(lenient->not_, (std::vector<Index>{2, 1, 0}));
    auto empty_rank = codec::decode_tier_state(missing, 3);
    ASSERT_TRUE(empty_rank);
    EXPECT_EQ(empty_rank->not_, (std::vector<Index>{0, 1, 2}));

    codec::DecodeOptions strict;
    strict.strict_rank_bytes = true;
    EXPECT_EQ(codec::decode_tier_state(padded, 3, strict).error().code(), ErrorCode::MALFORMED_FRAGMENT);
    EXPECT_EQ(codec::decode_tier_state(missing, 3, strict).error().code(), ErrorCode::MALFORMED_FRAGMENT);
}

TEST(TierCodec, LowLevelDecodeAndSplit) {
    const Bytes raw = {0x01, 0x00, 0x02, 0x00, 0x01, 0x11, 0x9C, 0x70};
    auto d = codec::decode_bytes_to_permutation(raw, 10);
    ASSERT_TRUE(d);
    EXPECT_EQ(d->perm, (Permutation{3, 1, 7, 0, 2, 4, 5, 6, 8, 9}));

    auto s = codec::split_permutation(*d);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->very, (std::vector<Index>{3, 1}));
    EXPECT_EQ(s->somewhat, (std::vector<Index>{7}));
    EXPECT_EQ(s->not_.size(), 7u);

    auto f = codec::decode_fragment_to_permutation("AQACAAERnHA", 10);
    ASSERT_TRUE(f);
    EXPECT_EQ(*f, *d);
}

TEST(TierCodec, SplitRejectsCutPointsPastTheEnd) {
    DecodedPermutation d;
    d.perm = {0, 1, 2};
    d.k1 = 2;
    d.k2 = 5;
    auto r = codec::split_permutation(d);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_CUT_POINTS);

    d.k1 = 4;
    d.k2 = 0;
    EXPECT_EQ(codec::split_permutation(d).error().code(), ErrorCode::INVALID_CUT_POINTS);

    d.k1 = 1;
    d.k2 = 2;
    auto all = codec::split_permutation(d);
    ASSERT_TRUE(all);
    EXPECT_EQ(all->very, (std::vector<Index>{0}));
    EXPECT_EQ(all->somewhat, (std::vector<Index>{1, 2}));
    EXPECT_TRUE(all->not_.empty());
}

TEST(TierCodec, ErrorRendersForLogs) {
    auto r = codec::decode_tier_state(fragment_of({0x07, 0, 0, 0, 0, 0}), 3);
    ASSERT_FALSE(r);
    const std::string line = r.error().to_string();
    EXPECT_NE(line.find("UNSUPPORTED_VERSION"), std::string::npos);
    EXPECT_NE(line.find("codec::decode_bytes_to_permutation"), std::string::npos);
    EXPECT_EQ(r.error().severity(), ErrorSeverity::MEDIUM);
    EXPECT_EQ(r.error().category(), ErrorCategory::FORMAT);
    EXPECT_EQ(r.error().component(), "codec");
    EXPECT_EQ(r.error().operation(), "decode_bytes_to_permutation");
    EXPECT_THROW(r.error().throw_as_exception(), std::runtime_error);
    EXPECT_THROW((void)r.value(), std::runtime_error);
}
