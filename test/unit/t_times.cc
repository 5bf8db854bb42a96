#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE util
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "utils.h"
#include "times.h"

using namespace timeshift;

struct times_fixture {
  times_fixture() {
    epoch = none;
  }
  ~times_fixture() {
    epoch = none;
    error_context();
  }
};

BOOST_FIXTURE_TEST_SUITE(times, times_fixture)

BOOST_AUTO_TEST_CASE(testParseMoment)
{
  moment_t m1 = parse_moment("2020-06-13T14:55:22Z");
  BOOST_CHECK_EQUAL(civil_date_t(2020, 6, 13), m1.date());
  BOOST_CHECK_EQUAL(time_duration_t(14, 55, 22), m1.time_of_day());
  BOOST_CHECK_EQUAL(time_duration_t(0, 0, 0), m1.offset);

  moment_t m2 = parse_moment("2020-06-13T14:55:21+03:00");
  BOOST_CHECK_EQUAL(time_duration_t(14, 55, 21), m2.time_of_day());
  BOOST_CHECK_EQUAL(time_duration_t(3, 0, 0), m2.offset);

  moment_t m3 = parse_moment("2020-06-13 14:55-0530");
  BOOST_CHECK_EQUAL(time_duration_t(14, 55, 0), m3.time_of_day());
  BOOST_CHECK_EQUAL(-(posix_time::hours(5) + posix_time::minutes(30)), m3.offset);

  moment_t m4 = parse_moment("2021-03-20");
  BOOST_CHECK_EQUAL(civil_date_t(2021, 3, 20), m4.date());
  BOOST_CHECK_EQUAL(time_duration_t(0, 0, 0), m4.time_of_day());

  moment_t m5 = parse_moment("2021-03-20T00:00:00.009999234Z");
  BOOST_CHECK_EQUAL(9999234L, m5.time_of_day().fractional_seconds());

  moment_t m6 = parse_moment("2021-03-20T00:00:00.5Z");
  BOOST_CHECK_EQUAL(500000000L, m6.time_of_day().fractional_seconds());

  moment_t m7 = parse_moment("  2021-03-20T10:00:00z  ");
  BOOST_CHECK_EQUAL(time_duration_t(10, 0, 0), m7.time_of_day());

  moment_t m8 = parse_moment("1970-01-02T00:00:00Z");
  BOOST_CHECK_EQUAL(1LL, m8.day);

  moment_t m9 = parse_moment("-0001-06-13T14:55:22Z");
  BOOST_CHECK_EQUAL(civil_date_t(-1, 6, 13), m9.date());

  moment_t m10 = parse_moment("10020-06-13T14:55:22Z");
  BOOST_CHECK_EQUAL(civil_date_t(10020, 6, 13), m10.date());
}

BOOST_AUTO_TEST_CASE(testParseMomentErrors)
{
  BOOST_CHECK_THROW(parse_moment(""), datetime_error);
  BOOST_CHECK_THROW(parse_moment("yesterday"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2020/06/13"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2020-02-30"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2100-02-29"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2021-13-01"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2021-00-10"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2021-01-01T24:00:00Z"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2021-01-01T12:60:00Z"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2021-01-01T12:00:00+25:00"), datetime_error);
  BOOST_CHECK_THROW(parse_moment("2021-01-01T12:00:00.1234567890Z"),
                    datetime_error);
}

BOOST_AUTO_TEST_CASE(testFormatMoment)
{
  BOOST_CHECK_EQUAL(string("2020-06-13T14:55:22Z"),
                    format_moment(parse_moment("2020-06-13T14:55:22Z")));
  BOOST_CHECK_EQUAL(string("2020-06-13T14:55:21+03:00"),
                    format_moment(parse_moment("2020-06-13T14:55:21+0300")));
  BOOST_CHECK_EQUAL(string("2020-06-13T14:55:21-05:30"),
                    format_moment(parse_moment("2020-06-13T14:55:21-05:30")));
  BOOST_CHECK_EQUAL(string("2021-03-20T00:00:00.009999234Z"),
                    format_moment(parse_moment("2021-03-20T00:00:00.009999234Z")));
  BOOST_CHECK_EQUAL(string("2021-03-20T00:00:00.25Z"),
                    format_moment(parse_moment("2021-03-20T00:00:00.250Z")));
  BOOST_CHECK_EQUAL(string("1970-01-01T00:00:00Z"), format_moment(moment_t()));

  BOOST_CHECK_EQUAL(string("0001-06-13T14:55:22Z"),
                    format_moment(moment_t(day_number(civil_date_t(1, 6, 13)),
                                           time_duration_t(14, 55, 22))));
  BOOST_CHECK_EQUAL(string("-0001-06-13T14:55:22Z"),
                    format_moment(moment_t(day_number(civil_date_t(-1, 6, 13)),
                                           time_duration_t(14, 55, 22))));
  BOOST_CHECK_EQUAL(string("10020-06-13T14:55:22Z"),
                    format_moment(moment_t(day_number(civil_date_t(10020, 6, 13)),
                                           time_duration_t(14, 55, 22))));

  std::ostringstream out;
  out << parse_moment("2000-02-29");
  BOOST_CHECK_EQUAL(string("2000-02-29T00:00:00Z"), out.str());
}

BOOST_AUTO_TEST_CASE(testMomentEquality)
{
  moment_t utc   = parse_moment("2020-06-13T11:55:22Z");
  moment_t local = parse_moment("2020-06-13T14:55:22+03:00");

  BOOST_CHECK(utc != local);
  BOOST_CHECK(utc.same_instant(local));
  BOOST_CHECK_EQUAL(utc, local.utc());
  BOOST_CHECK(local == parse_moment("2020-06-13T14:55:22+03:00"));

  moment_t early = parse_moment("2020-06-13T01:00:00+03:00");
  BOOST_CHECK_EQUAL(parse_moment("2020-06-12T22:00:00Z"), early.utc());
}

BOOST_AUTO_TEST_CASE(testMomentCarriesTime)
{
  moment_t late(10, time_duration_t(25, 30, 0));
  BOOST_CHECK_EQUAL(11LL, late.day);
  BOOST_CHECK_EQUAL(time_duration_t(1, 30, 0), late.time);

  moment_t early(10, time_duration_t(0, 0, 0) - posix_time::nanoseconds(1));
  BOOST_CHECK_EQUAL(9LL, early.day);
  BOOST_CHECK_EQUAL(time_duration_t(23, 59, 59) + posix_time::nanoseconds(999999999),
                    early.time);
}

BOOST_AUTO_TEST_CASE(testPtimeConversion)
{
  datetime_t noon(date_t(2021, 2, 28), time_duration_t(12, 0, 0));
  moment_t   when(noon, time_duration_t(2, 0, 0));

  BOOST_CHECK_EQUAL(civil_date_t(2021, 2, 28), when.date());
  BOOST_CHECK(when.is_representable());
  BOOST_CHECK_EQUAL(noon, when.local());

  moment_t far(day_number(civil_date_t(10020, 6, 13)), time_duration_t(1, 0, 0));
  BOOST_CHECK(! far.is_representable());
  BOOST_CHECK_THROW(far.local(), datetime_error);

  moment_t ancient(day_number(civil_date_t(1399, 12, 31)), time_duration_t(0, 0, 0));
  BOOST_CHECK(! ancient.is_representable());

  datetime_t special(boost::posix_time::not_a_date_time);
  BOOST_CHECK_THROW(moment_t when2(special), datetime_error);
}

BOOST_AUTO_TEST_CASE(testDayNumbers)
{
  BOOST_CHECK_EQUAL(0LL, day_number(civil_date_t(1970, 1, 1)));
  BOOST_CHECK_EQUAL(-1LL, day_number(civil_date_t(1969, 12, 31)));
  BOOST_CHECK_EQUAL(10957LL, day_number(civil_date_t(2000, 1, 1)));
  BOOST_CHECK_EQUAL(-719162LL, day_number(civil_date_t(1, 1, 1)));

  BOOST_CHECK_EQUAL(civil_date_t(2000, 1, 1), civil_date(10957));
  BOOST_CHECK_EQUAL(civil_date_t(0, 12, 31), civil_date(-719163));
  BOOST_CHECK_EQUAL(civil_date_t(2400, 2, 29),
                    civil_date(day_number(civil_date_t(2400, 2, 29))));
  BOOST_CHECK_EQUAL(civil_date_t(-400, 3, 1),
                    civil_date(day_number(civil_date_t(-400, 2, 29)) + 1));

  BOOST_CHECK_THROW(day_number(civil_date_t(2021, 2, 29)), datetime_error);
  BOOST_CHECK_THROW(day_number(civil_date_t(2021, 0, 1)), datetime_error);

  BOOST_CHECK(is_leap_year(2000));
  BOOST_CHECK(is_leap_year(0));
  BOOST_CHECK(! is_leap_year(1900));
  BOOST_CHECK(! is_leap_year(10100));
  BOOST_CHECK_EQUAL(29, days_in_month(-4, 2));
  BOOST_CHECK_EQUAL(30, days_in_month(12345, 4));
}

BOOST_AUTO_TEST_CASE(testNormalizedDay)
{
  BOOST_CHECK_EQUAL(civil_date_t(2021, 2, 3), civil_date(normalized_day(2021, 2, 3)));
  BOOST_CHECK_EQUAL(civil_date_t(2022, 10, 1), civil_date(normalized_day(2021, 22, 1)));
  BOOST_CHECK_EQUAL(civil_date_t(2020, 11, 1), civil_date(normalized_day(2021, -1, 1)));
  BOOST_CHECK_EQUAL(civil_date_t(2020, 12, 1), civil_date(normalized_day(2021, 0, 1)));
  BOOST_CHECK_EQUAL(civil_date_t(2000, 2, 29), civil_date(normalized_day(2000, 3, 0)));
  BOOST_CHECK_EQUAL(civil_date_t(2100, 2, 28), civil_date(normalized_day(2100, 3, 0)));
  BOOST_CHECK_EQUAL(civil_date_t(2021, 3, 5), civil_date(normalized_day(2021, 2, 33)));
  BOOST_CHECK_EQUAL(civil_date_t(2021, 8, 29), civil_date(normalized_day(2021, 9, -2)));
  BOOST_CHECK_EQUAL(civil_date_t(10000, 1, 31), civil_date(normalized_day(9999, 12, 62)));
  BOOST_CHECK_EQUAL(civil_date_t(0, 12, 31), civil_date(normalized_day(1, 1, 0)));
}

BOOST_AUTO_TEST_CASE(testNormalizedMoment)
{
  BOOST_CHECK_EQUAL(moment_t(normalized_day(2022, 11, 4), time_duration_t(21, 25, 0)),
                    normalized_moment(2021, 22, 33, 66, 200, 300));
  BOOST_CHECK_EQUAL(moment_t(normalized_day(2020, 10, 31), time_duration_t(7, 58, 59)),
                    normalized_moment(2021, -1, 0, 8, -1, -1));
  BOOST_CHECK_EQUAL(moment_t(normalized_day(2020, 12, 31), time_duration_t(23, 59, 59) +
                             posix_time::nanoseconds(999999999)),
                    normalized_moment(2021, 1, 1, 0, 0, 0, -1));
  BOOST_CHECK_EQUAL(moment_t(normalized_day(2021, 3, 20), time_duration_t(0, 0, 1) +
                             posix_time::nanoseconds(500)),
                    normalized_moment(2021, 3, 20, 0, 0, 0, 1000000500LL));

  moment_t shifted = normalized_moment(2021, 3, 20, 12, 0, 0, 0,
                                       time_duration_t(-4, 0, 0));
  BOOST_CHECK_EQUAL(time_duration_t(-4, 0, 0), shifted.offset);
  BOOST_CHECK_EQUAL(time_duration_t(12, 0, 0), shifted.time);
}

BOOST_AUTO_TEST_CASE(testCalendarHelpers)
{
  BOOST_CHECK_EQUAL(1, weekday_of(day_number(civil_date_t(2021, 2, 22))));
  BOOST_CHECK_EQUAL(0, weekday_of(day_number(civil_date_t(2021, 2, 7))));
  BOOST_CHECK_EQUAL(6, weekday_of(day_number(civil_date_t(2021, 1, 2))));
  BOOST_CHECK_EQUAL(4, weekday_of(0));
  BOOST_CHECK_EQUAL(1, weekday_of(day_number(civil_date_t(1, 1, 1))));

  day_number_t day = day_number(civil_date_t(2021, 3, 20));
  BOOST_CHECK_EQUAL(civil_date_t(2021, 3, 1), civil_date(first_day_of_month(day)));
  BOOST_CHECK_EQUAL(civil_date_t(2021, 3, 31), civil_date(last_day_of_month(day)));
  BOOST_CHECK_EQUAL(civil_date_t(2021, 1, 1), civil_date(first_day_of_year(day)));
  BOOST_CHECK_EQUAL(civil_date_t(2020, 2, 29),
                    civil_date(last_day_of_month(day_number(civil_date_t(2020, 2, 1)))));
}

BOOST_AUTO_TEST_CASE(testCurrentMoment)
{
  epoch = parse_moment("2021-01-20T08:00:00+01:00");
  BOOST_CHECK(*epoch == CURRENT_MOMENT());

  epoch = none;
  moment_t now = CURRENT_MOMENT();
  BOOST_CHECK(now.is_representable());
  BOOST_CHECK(now.date().year >= 2020);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(utils)

BOOST_AUTO_TEST_CASE(testSplitArguments)
{
  strings_list args = split_arguments("\"Y+1 M+2\" 2020-06-13T14:55:22Z  x");
  BOOST_REQUIRE_EQUAL(3U, args.size());
  BOOST_CHECK_EQUAL(string("Y+1 M+2"), args.front());
  BOOST_CHECK_EQUAL(string("x"), args.back());

  args = split_arguments("'D$1' a\\ b");
  BOOST_REQUIRE_EQUAL(2U, args.size());
  BOOST_CHECK_EQUAL(string("D$1"), args.front());
  BOOST_CHECK_EQUAL(string("a b"), args.back());

  BOOST_CHECK(split_arguments("   ").empty());
  BOOST_CHECK_THROW(split_arguments("\"W^1 w0"), std::logic_error);
}

BOOST_AUTO_TEST_CASE(testLineContext)
{
  BOOST_CHECK_EQUAL(string("  M1 Y2\n     ^^"), line_context("M1 Y2", 3, 5));
  BOOST_CHECK_EQUAL(string("  YM2\n   ^"), line_context("YM2", 1));

  error_context();
  add_error_context("first");
  add_error_context("second");
  BOOST_CHECK_EQUAL(string("first\nsecond"), error_context());
  BOOST_CHECK_EQUAL(string(""), error_context());
}

BOOST_AUTO_TEST_CASE(testBlank)
{
  BOOST_CHECK(is_blank(""));
  BOOST_CHECK(is_blank(" \t\n"));
  BOOST_CHECK(! is_blank("  Y1 "));
}

BOOST_AUTO_TEST_SUITE_END()
