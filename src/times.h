/*
 * Copyright (c) 2026, the timeshift contributors.  All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are
 * met:
 *
 * - Redistributions of source code must retain the above copyright
 *   notice, this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright
 *   notice, this list of conditions and the following disclaimer in the
 *   documentation and/or other materials provided with the distribution.
 *
 * - Neither the name of the timeshift project nor the names of its
 *   contributors may be used to endorse or promote products derived from
 *   this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/**
 * @addtogroup util
 */

/**
 * @file   times.h
 * @author timeshift contributors
 *
 * @ingroup util
 *
 * @brief moment_t objects and calendar arithmetic
 *
 * A moment is a wall-clock time together with the UTC offset it was
 * read in.  All calendar arithmetic happens on the wall clock, and the
 * offset is carried through untouched.
 *
 * Dates are kept as day numbers on the proleptic Gregorian calendar, so
 * arithmetic never leaves the representable range.  Boost.Date_Time does
 * the calendar work: since the Gregorian calendar repeats every 400
 * years, any date is first brought into the years 2000-2399.
 */
#ifndef _TIMES_H
#define _TIMES_H

#include "utils.h"

namespace timeshift {

DECLARE_EXCEPTION(datetime_error, std::runtime_error);

typedef boost::posix_time::ptime        datetime_t;
typedef datetime_t::time_duration_type  time_duration_t;
typedef boost::gregorian::date          date_t;

/** Days since 1970-01-01, negative before it. */
typedef long long day_number_t;

#define TRUE_CURRENT_TIME() (boost::posix_time::microsec_clock::local_time())

struct civil_date_t : public equality_comparable<civil_date_t>
{
  long long year;               // astronomical numbering, 0 is 1 BC
  int       month;
  int       day;

  civil_date_t(long long _year = 1970, int _month = 1, int _day = 1)
    : year(_year), month(_month), day(_day) {}

  bool operator==(const civil_date_t& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
};

std::ostream& operator<<(std::ostream& out, const civil_date_t& date);

/** Throws datetime_error if the month or day does not exist. */
day_number_t day_number(const civil_date_t& date);
civil_date_t civil_date(const day_number_t day);

bool is_leap_year(const long long year);
int  days_in_month(const long long year, const int month);

struct moment_t : public equality_comparable<moment_t>
{
  day_number_t    day;          // wall-clock date, in this moment's offset
  time_duration_t time;         // wall-clock time of day, below 24:00
  time_duration_t offset;       // east of UTC

  moment_t() : day(0), time(0, 0, 0), offset(0, 0, 0) {}

  /** A time of day outside [00:00, 24:00) carries into the day. */
  moment_t(const day_number_t     _day,
           const time_duration_t& _time,
           const time_duration_t& _offset = time_duration_t(0, 0, 0));

  explicit moment_t(const datetime_t&      local,
                    const time_duration_t& _offset = time_duration_t(0, 0, 0));

  /** Two moments are equal only if they carry the same wall clock and
      the same offset.  Use same_instant() to compare points in time. */
  bool operator==(const moment_t& other) const {
    return day == other.day && time == other.time && offset == other.offset;
  }

  moment_t utc() const {
    return moment_t(day, time - offset);
  }
  bool same_instant(const moment_t& other) const {
    moment_t mine(utc()), theirs(other.utc());
    return mine.day == theirs.day && mine.time == theirs.time;
  }

  civil_date_t date() const {
    return civil_date(day);
  }
  time_duration_t time_of_day() const {
    return time;
  }

  /** True if the wall clock fits a ptime, years 1400 to 9999. */
  bool is_representable() const;

  /** The wall clock as a ptime; throws datetime_error if it does not
      fit. */
  datetime_t local() const;
};

extern optional<moment_t> epoch;

moment_t true_current_moment();

#define CURRENT_MOMENT() (epoch ? *epoch : true_current_moment())

moment_t parse_moment(const char * str);

inline moment_t parse_moment(const std::string& str) {
  return parse_moment(str.c_str());
}

std::string format_moment(const moment_t& when);
std::string format_offset(const time_duration_t& offset);

std::ostream& operator<<(std::ostream& out, const moment_t& when);

/**
 * @name Calendar arithmetic
 *
 * The fields given to these functions may lie outside their natural
 * range.  Overflow carries through the calendar: month 14 of 2020 is
 * February 2021, day 0 is the last day of the previous month, and 90
 * minutes is an hour and a half.  None of them fail.
 */
/*@{*/

day_number_t normalized_day(long long year, long long month, long long day);

moment_t normalized_moment(long long year, long long month, long long day,
                           long long hour, long long minute, long long second,
                           long long nanoseconds = 0,
                           const time_duration_t& offset =
                           time_duration_t(0, 0, 0));

/** Sunday is 0, Saturday 6. */
int weekday_of(const day_number_t day);

day_number_t first_day_of_month(const day_number_t day);
day_number_t last_day_of_month(const day_number_t day);
day_number_t first_day_of_year(const day_number_t day);

/*@}*/

} // namespace timeshift

#endif // _TIMES_H
