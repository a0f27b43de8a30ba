#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "test_helpers.hpp"
#include "profile/profile.hpp"
#include "profile/profile_config.hpp"
#include "profile/summary.hpp"
#include "report/render_summary.hpp"
#include "types/parse_date.hpp"

using namespace tabprof;
using namespace tabprof::test;

namespace {

// id, value, department, active, notes (all absent), signup, score; 50 rows.
dataset people() {
    std::vector<cell> signup, score;
    const instant_us first = days_from_civil(2024, 1, 1) * us_per_day;
    for (int i = 0; i < 50; ++i) {
        signup.push_back(str(format_instant(first + i * us_per_day).substr(0, 10)));
        score.push_back(real(i + 0.5));
    }
    return make_dataset({
        column{ "id", int_range(1, 50) },
        column{ "value", text_range(1, 50) },
        column{ "department", departments() },
        column{ "active", flags() },
        column{ "notes", repeat(absent(), 50) },
        column{ "signup", signup },
        column{ "score", score },
    }, "people.csv");
}

}

TEST(ProfileDataset, FieldsFollowSourceOrderWithInferredTypes) {
    const analysis_report r = profile_dataset(people(), profile_config{});
    EXPECT_EQ(r.source.path, "people.csv");
    EXPECT_EQ(r.total_rows, 50u);
    EXPECT_EQ(r.total_columns, 7u);
    ASSERT_EQ(r.fields.size(), 7u);

    const std::vector<std::string> names{ "id", "value", "department", "active", "notes", "signup", "score" };
    const std::vector<field_type> types{ field_type::identifier_, field_type::integer_, field_type::categorical_,
                                         field_type::boolean_, field_type::string_, field_type::datetime_,
                                         field_type::float_ };
    for (std::size_t i = 0; i < names.size(); ++i) {
        EXPECT_EQ(r.fields[i].name, names[i]);
        EXPECT_EQ(r.fields[i].type, types[i]) << names[i];
    }
}

TEST(ProfileDataset, CountsAndSamplesSkipAbsentCells) {
    const analysis_report r = profile_dataset(people(), profile_config{});
    EXPECT_EQ(r.fields[0].total_count, 50u);
    EXPECT_EQ(r.fields[4].total_count, 0u);
    EXPECT_TRUE(r.fields[4].sample_values.empty());

    const auto& value = r.fields[1].sample_values;
    ASSERT_EQ(value.size(), 5u);
    EXPECT_EQ(value[0], str("1"));
    EXPECT_EQ(value[4], str("5"));
    EXPECT_EQ(r.fields[0].sample_values[2], num(3));
}

TEST(ProfileDataset, SampleValueCountIsConfigurable) {
    profile_options o;
    o.sample_value_count = 2;
    const analysis_report r = profile_dataset(people(), profile_config{o});
    for (const auto& f : r.fields) EXPECT_LE(f.sample_values.size(), 2u);
}

TEST(ProfileDataset, StatsBlockMatchesType) {
    const analysis_report r = profile_dataset(people(), profile_config{});
    for (const auto& f : r.fields) {
        if (uses_categorical_stats(f.type))        EXPECT_TRUE(std::holds_alternative<categorical_stats>(f.stats)) << f.name;
        else if (is_numeric(f.type))               EXPECT_TRUE(std::holds_alternative<numerical_stats>(f.stats)) << f.name;
        else if (f.type == field_type::datetime_)  EXPECT_TRUE(std::holds_alternative<datetime_stats>(f.stats)) << f.name;
        else                                       EXPECT_TRUE(std::holds_alternative<string_stats>(f.stats)) << f.name;
    }
}

TEST(ProfileDataset, CompletenessIsMeanOfColumnCompleteness) {
    const analysis_report r = profile_dataset(people(), profile_config{});
    // six complete columns and one empty one: 100 - 100/7
    EXPECT_DOUBLE_EQ(r.completeness_percentage, 85.71);
    EXPECT_GE(r.processing_time_seconds, 0.0);
    EXPECT_GT(r.analysis_timestamp, 0);
}

TEST(ProfileDataset, RepeatedRunsAgree) {
    const dataset ds = people();
    const profile_config cfg;
    const analysis_report a = profile_dataset(ds, cfg);
    const analysis_report b = profile_dataset(ds, cfg);
    EXPECT_TRUE(a.fields == b.fields);
    EXPECT_EQ(a.completeness_percentage, b.completeness_percentage);
}

TEST(ProfileDataset, ParallelMatchesSequential) {
    const dataset ds = people();
    profile_options o;
    o.worker_threads = 3;
    const analysis_report seq = profile_dataset(ds, profile_config{});
    const analysis_report par = profile_dataset(ds, profile_config{o});
    EXPECT_TRUE(seq.fields == par.fields);
    EXPECT_EQ(seq.completeness_percentage, par.completeness_percentage);
}

TEST(ProfileDataset, MismatchedColumnLengthsAreRejected) {
    dataset ds = people();
    ds.columns[2].values.pop_back();
    EXPECT_THROW(profile_dataset(ds, profile_config{}), std::invalid_argument);
}

TEST(ProfileDataset, ZeroRowsProfilesEveryColumnAsEmptyString) {
    dataset ds = make_dataset({ column{ "a", {} }, column{ "b", {} } });
    const analysis_report r = profile_dataset(ds, profile_config{});
    ASSERT_EQ(r.fields.size(), 2u);
    for (const auto& f : r.fields) {
        EXPECT_EQ(f.type, field_type::string_);
        EXPECT_EQ(f.total_count, 0u);
        EXPECT_EQ(missing_percentage(f.stats), 0.0);
    }
    EXPECT_EQ(r.completeness_percentage, 0.0);
}

TEST(ProfileDataset, NoColumns) {
    const analysis_report r = profile_dataset(make_dataset({}), profile_config{});
    EXPECT_TRUE(r.fields.empty());
    EXPECT_EQ(r.total_columns, 0u);
    EXPECT_EQ(r.completeness_percentage, 0.0);
}

TEST(Summary, CountsTypesAndMissing) {
    const analysis_report r = profile_dataset(people(), profile_config{});
    const report_summary s = summarize(r);
    EXPECT_EQ(s.total_fields, 7u);
    EXPECT_EQ(s.total_missing, 50u);
    EXPECT_EQ(s.type_counts.at("integer"), 1u);
    EXPECT_EQ(s.type_counts.at("identifier"), 1u);
    EXPECT_EQ(s.type_counts.size(), 7u);
    EXPECT_DOUBLE_EQ(s.completeness_percentage, 85.71);

    const auto groups = group_by_type(r);
    ASSERT_EQ(groups.at("categorical").size(), 1u);
    EXPECT_EQ(groups.at("categorical")[0], "department");
    EXPECT_EQ(groups.at("string")[0], "notes");
}

TEST(RenderSummary, ShowsShapeAndQuality) {
    const analysis_report r = profile_dataset(people(), profile_config{});
    const std::string text = render_summary(r);
    EXPECT_NE(text.find("File: people.csv"), std::string::npos);
    EXPECT_NE(text.find("Rows: 50"), std::string::npos);
    EXPECT_NE(text.find("Columns: 7"), std::string::npos);
    EXPECT_NE(text.find("  - boolean: 1"), std::string::npos);
    EXPECT_NE(text.find("Completeness: 85.7%"), std::string::npos);
    EXPECT_NE(text.find("Missing values: 50"), std::string::npos);
}

TEST(RenderSummary, SampleTableClipsLongCells) {
    const std::vector<sample_row> rows{ sample_row{ 0, { num(1), str("a rather long piece of text") } } };
    const std::string table = render_sample_table({ "n", "text" }, rows, 10);
    EXPECT_NE(table.find("#"), std::string::npos);
    EXPECT_NE(table.find("a rather ~"), std::string::npos);
    EXPECT_EQ(table.find("long piece"), std::string::npos);
}

TEST(ProfileDataset, QuartilesAreOrdered) {
    const analysis_report r = profile_dataset(people(), profile_config{});
    for (const auto& f : r.fields) {
        const auto* n = std::get_if<numerical_stats>(&f.stats);
        if (!n || !n->quartiles) continue;
        EXPECT_LE(n->quartiles->q25, n->quartiles->q50) << f.name;
        EXPECT_LE(n->quartiles->q50, n->quartiles->q75) << f.name;
    }
}
