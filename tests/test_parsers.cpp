#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "test_helpers.hpp"
#include "profile/profile_config.hpp"
#include "types/parse_bool.hpp"
#include "types/parse_date.hpp"
#include "types/parse_number.hpp"
#include "util/json_escape.hpp"
#include "util/nulls.hpp"
#include "util/text.hpp"

using namespace tabprof;
using namespace tabprof::test;

// ---------- numbers ----------
TEST(ParseNumber, RecognizesNumericText) {
    EXPECT_TRUE(is_float64("-42"));
    EXPECT_TRUE(is_float64("1e3"));
    EXPECT_TRUE(is_float64("-.5"));
    EXPECT_TRUE(is_float64("2.5E-3"));
    EXPECT_FALSE(is_float64("1e"));
    EXPECT_FALSE(is_float64("e3"));
    EXPECT_FALSE(is_float64("."));
    EXPECT_FALSE(is_float64("1.2.3"));
    EXPECT_FALSE(is_float64("nan"));
}

TEST(ParseNumber, ReadsCells) {
    EXPECT_EQ(parse_number(str("  3.5 ")), 3.5);
    EXPECT_EQ(parse_number(str("1e3")), 1000.0);
    EXPECT_EQ(parse_number(num(7)), 7.0);
    EXPECT_EQ(parse_number(real(0.25)), 0.25);
    EXPECT_FALSE(parse_number(str("abc")).has_value());
    EXPECT_FALSE(parse_number(str("1e999")).has_value());
    EXPECT_FALSE(parse_number(cell{ true }).has_value());
    EXPECT_FALSE(parse_number(real(std::numeric_limits<double>::infinity())).has_value());
}

// ---------- booleans ----------
TEST(ParseBool, AcceptsCommonLiterals) {
    EXPECT_EQ(bool_literal(str(" Yes ")), std::string("yes"));
    EXPECT_EQ(bool_literal(cell{ false }), std::string("false"));
    EXPECT_EQ(bool_literal(num(1)), std::string("1"));
    EXPECT_EQ(bool_literal(real(0.0)), std::string("0"));
    EXPECT_EQ(parse_bool(str("OFF")), false);
    EXPECT_EQ(parse_bool(str("t")), true);
    EXPECT_EQ(parse_bool(str("Y")), true);
}

TEST(ParseBool, RejectsOtherValues) {
    EXPECT_FALSE(bool_literal(num(2)).has_value());
    EXPECT_FALSE(bool_literal(str("maybe")).has_value());
    EXPECT_FALSE(parse_bool(real(0.5)).has_value());
    EXPECT_FALSE(parse_bool(absent()).has_value());
}

// ---------- dates ----------
TEST(ParseDate, CivilConversionsAgree) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
    const civil_date d = civil_from_days(days_from_civil(2024, 2, 29));
    EXPECT_EQ(d.year, 2024);
    EXPECT_EQ(d.month, 2u);
    EXPECT_EQ(d.day, 29u);
    EXPECT_EQ(days_in_month(2023, 2), 28u);
    EXPECT_EQ(days_in_month(2000, 2), 29u);
}

TEST(ParseDate, ParsesConfiguredFormats) {
    const auto fmts = profile_config{}.datetime_formats();
    const instant_us jan5 = days_from_civil(2024, 1, 5) * us_per_day;

    EXPECT_EQ(parse_datetime(std::string_view("2024-01-05"), fmts), jan5);
    EXPECT_EQ(parse_datetime(std::string_view("01/05/2024"), fmts), jan5);
    EXPECT_EQ(parse_datetime(std::string_view("05.01.2024"), fmts), jan5);
    EXPECT_EQ(parse_datetime(std::string_view("2024/01/05"), fmts), jan5);
    EXPECT_EQ(parse_datetime(std::string_view("2024-01-05 10:30"), fmts),
              jan5 + (10 * 3600 + 30 * 60) * us_per_second);
    EXPECT_EQ(parse_datetime(std::string_view("2024-01-05T08:00:00Z"), fmts),
              jan5 + 8 * 3600 * us_per_second);
    EXPECT_EQ(parse_datetime(std::string_view("2024-01-05 10:30:15.250"), fmts),
              jan5 + (10 * 3600 + 30 * 60 + 15) * us_per_second + 250000);
}

TEST(ParseDate, RejectsNonDates) {
    const auto fmts = profile_config{}.datetime_formats();
    EXPECT_FALSE(parse_datetime(std::string_view("2024-02-30"), fmts).has_value());
    EXPECT_FALSE(parse_datetime(std::string_view("12"), fmts).has_value());
    EXPECT_FALSE(parse_datetime(std::string_view("3.5"), fmts).has_value());
    EXPECT_FALSE(parse_datetime(std::string_view("2024-01-05 garbage"), fmts).has_value());
    EXPECT_FALSE(parse_datetime(std::string_view(""), fmts).has_value());
    EXPECT_FALSE(parse_datetime(num(20240105), fmts).has_value());
}

TEST(ParseDate, FormatsInstants) {
    const instant_us t = days_from_civil(2024, 1, 5) * us_per_day + (10 * 3600 + 30 * 60 + 15) * us_per_second;
    EXPECT_EQ(format_instant(t), "2024-01-05 10:30:15");
    EXPECT_EQ(format_instant(t, true), "2024-01-05 10:30:15.000000");
    EXPECT_EQ(format_instant(t + 250000), "2024-01-05 10:30:15.250000");
    EXPECT_EQ(format_instant(-1), "1969-12-31 23:59:59.999999");
    EXPECT_EQ(parse_instant(format_instant(t + 250000, true)), t + 250000);
}

// ---------- text ----------
TEST(Text, WildcardMatchIsCaseInsensitive) {
    EXPECT_TRUE(wildcard_match("*_id", "customer_id"));
    EXPECT_TRUE(wildcard_match("id", "ID"));
    EXPECT_TRUE(wildcard_match("id_*", "id_"));
    EXPECT_TRUE(wildcard_match("*uuid*", "session_UUID_v4"));
    EXPECT_FALSE(wildcard_match("id", "paid"));
    EXPECT_FALSE(wildcard_match("*_id", "identity"));
}

TEST(Text, CountsCodePoints) {
    EXPECT_EQ(utf8_length("h\xc3\xa9llo"), 5u);
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(trim("  a b \t"), "a b");
}

TEST(Text, ReplacesMalformedUtf8) {
    EXPECT_EQ(to_valid_utf8("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(to_valid_utf8("caf\xe9"), "caf\xEF\xBF\xBD");
    EXPECT_EQ(to_valid_utf8("\xc0\xaf"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(to_valid_utf8("\xed\xa0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(to_valid_utf8("a\xe2\x82"), "a\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(to_valid_utf8("\xf0\x9f\x98\x80"), "\xf0\x9f\x98\x80");
}

TEST(Nulls, AbsentCells) {
    EXPECT_TRUE(is_absent(absent()));
    EXPECT_TRUE(is_absent(str("   ")));
    EXPECT_TRUE(is_absent(real(std::numeric_limits<double>::quiet_NaN())));
    EXPECT_TRUE(is_absent(real(std::numeric_limits<double>::infinity())));
    EXPECT_TRUE(is_absent(real(-std::numeric_limits<double>::infinity())));
    EXPECT_FALSE(is_absent(real(0.0)));
    EXPECT_FALSE(is_absent(num(0)));
    EXPECT_FALSE(is_absent(cell{ false }));
    EXPECT_TRUE(is_null_like(" N/A ", default_null_tokens()));
    EXPECT_FALSE(is_null_like("n/a", default_null_tokens()));
}

// ---------- json text ----------
TEST(JsonText, EscapesAndNumbers) {
    EXPECT_EQ(json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
    EXPECT_EQ(json_escape("caf\xe9"), "caf\xEF\xBF\xBD");
    EXPECT_EQ(json_escape("caf\xc3\xa9 \"x\""), "caf\xc3\xa9 \\\"x\\\"");
    EXPECT_EQ(json_quote("x"), "\"x\"");
    EXPECT_EQ(json_number(2.0), "2.0");
    EXPECT_EQ(json_number(0.1), "0.1");
    EXPECT_EQ(json_number(-3.25), "-3.25");
    EXPECT_EQ(json_number(std::numeric_limits<double>::quiet_NaN()), "null");
}
