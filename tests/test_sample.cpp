#include <gtest/gtest.h>
#include <cstddef>
#include <set>
#include <vector>

#include "test_helpers.hpp"
#include "profile/sample.hpp"

using namespace tabprof;
using namespace tabprof::test;

namespace {

dataset twenty_rows() {
    std::vector<cell> raw;
    for (int i = 0; i < 20; ++i) raw.push_back(str(" " + std::to_string(i) + " "));
    return make_dataset({ column{ "n", int_range(0, 19) }, column{ "raw", raw } });
}

}

TEST(SelectSampleRows, HeadTakesLeadingRowsVerbatim) {
    const dataset ds = twenty_rows();
    const auto rows = select_sample_rows(ds, 3, sample_mode::head);
    ASSERT_EQ(rows.size(), 3u);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].index, i);
        ASSERT_EQ(rows[i].values.size(), 2u);
        EXPECT_EQ(rows[i].values[0], num(static_cast<std::int64_t>(i)));
    }
    EXPECT_EQ(rows[2].values[1], str(" 2 "));
}

TEST(SelectSampleRows, HeadCapsAtRowCount) {
    const dataset ds = twenty_rows();
    EXPECT_EQ(select_sample_rows(ds, 100, sample_mode::head).size(), 20u);
    EXPECT_TRUE(select_sample_rows(ds, 0, sample_mode::head).empty());
    EXPECT_TRUE(select_sample_rows(make_dataset({}), 5, sample_mode::random).empty());
}

TEST(SelectSampleRows, RandomPicksDistinctRowsInSourceOrder) {
    const dataset ds = twenty_rows();
    const auto rows = select_sample_rows(ds, 4, sample_mode::random);
    ASSERT_EQ(rows.size(), 4u);
    std::set<std::size_t> seen;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        EXPECT_LT(rows[i].index, 20u);
        if (i > 0) {
            EXPECT_LT(rows[i - 1].index, rows[i].index);
        }
        EXPECT_EQ(rows[i].values[0], num(static_cast<std::int64_t>(rows[i].index)));
        seen.insert(rows[i].index);
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST(SelectSampleRows, SeedMakesRandomSelectionRepeatable) {
    const dataset ds = twenty_rows();
    const auto a = select_sample_rows(ds, 5, sample_mode::random, 42u);
    const auto b = select_sample_rows(ds, 5, sample_mode::random, 42u);
    EXPECT_TRUE(a == b);
}

TEST(SelectSampleRows, RandomWithEnoughRowsReturnsAll) {
    const dataset ds = twenty_rows();
    const auto rows = select_sample_rows(ds, 20, sample_mode::random);
    ASSERT_EQ(rows.size(), 20u);
    for (std::size_t i = 0; i < rows.size(); ++i) EXPECT_EQ(rows[i].index, i);
}

TEST(SampleMode, ParsesNames) {
    EXPECT_EQ(parse_sample_mode("head"), sample_mode::head);
    EXPECT_EQ(parse_sample_mode("random"), sample_mode::random);
    EXPECT_FALSE(parse_sample_mode("tail").has_value());
    EXPECT_STREQ(to_string(sample_mode::random), "random");
}
