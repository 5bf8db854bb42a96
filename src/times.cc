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

#include <system.hh>

#include "times.h"

#include <boost/date_time/c_local_time_adjustor.hpp>

namespace timeshift {

optional<moment_t> epoch;

namespace {
  const long long nanos_per_second = 1000000000LL;
  const long long seconds_per_day  = 86400LL;

  // The Gregorian calendar repeats every 400 years, which is also a
  // whole number of weeks.
  const long long    years_per_cycle = 400;
  const long long    days_per_cycle  = 146097;
  const long long    base_year       = 2000;
  const day_number_t base_day        = 10957;   // 2000-01-01

  const date_t       unix_epoch(1970, 1, 1);

  const long long    min_ptime_year  = 1400;
  const long long    max_ptime_year  = 9999;

  inline long long floor_div(long long num, long long den) {
    long long q = num / den;
    if ((num % den != 0) && ((num < 0) != (den < 0)))
      --q;
    return q;
  }

  inline long long floor_mod(long long num, long long den) {
    return num - floor_div(num, den) * den;
  }

  unsigned short reduced_year(const long long year, long long& cycles) {
    cycles = floor_div(year - base_year, years_per_cycle);
    return static_cast<unsigned short>(year - cycles * years_per_cycle);
  }

  date_t reduced_date(const day_number_t day, long long& cycles) {
    cycles = floor_div(day - base_day, days_per_cycle);
    return unix_epoch + gregorian::days(static_cast<long>(day - cycles *
                                                          days_per_cycle));
  }

  const char * const moment_pattern =
    "^([+-]?\\d{4,12})-(\\d{2})-(\\d{2})"
    "(?:[Tt ](\\d{2}):(\\d{2})(?::(\\d{2})(?:[.,](\\d{1,9}))?)?)?"
    "\\s*(?:([Zz])|([+-])(\\d{2}):?(\\d{2}))?$";

  int field(const boost::cmatch& what, int index, int fallback = 0) {
    if (! what[index].matched)
      return fallback;
    return lexical_cast<int>(what[index].str());
  }
}

std::ostream& operator<<(std::ostream& out, const civil_date_t& date)
{
  std::ostringstream buf;
  long long year = date.year;
  if (year < 0) {
    buf << '-';
    year = -year;
  }
  buf << std::setfill('0') << std::setw(4) << year << '-'
      << std::setw(2) << date.month << '-'
      << std::setw(2) << date.day;

  out << buf.str();
  return out;
}

day_number_t day_number(const civil_date_t& date)
{
  long long      cycles;
  unsigned short year = reduced_year(date.year, cycles);

  date_t reduced;
  try {
    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31)
      throw std::out_of_range("day or month");

    reduced = date_t(year, static_cast<unsigned short>(date.month),
                     static_cast<unsigned short>(date.day));
  }
  catch (const std::out_of_range&) {
    throw_(datetime_error, _f("Invalid date: %1%") % date);
  }

  return (reduced - unix_epoch).days() + cycles * days_per_cycle;
}

civil_date_t civil_date(const day_number_t day)
{
  long long cycles;
  date_t    reduced = reduced_date(day, cycles);

  return civil_date_t(static_cast<unsigned short>(reduced.year()) +
                      cycles * years_per_cycle,
                      static_cast<unsigned short>(reduced.month()),
                      static_cast<unsigned short>(reduced.day()));
}

bool is_leap_year(const long long year)
{
  long long cycles;
  return gregorian::gregorian_calendar::is_leap_year(reduced_year(year, cycles));
}

int days_in_month(const long long year, const int month)
{
  if (month < 1 || month > 12)
    throw_(datetime_error, _f("Invalid month: %1%") % month);

  long long cycles;
  return gregorian::gregorian_calendar::end_of_month_day
    (reduced_year(year, cycles), static_cast<unsigned short>(month));
}

moment_t::moment_t(const day_number_t     _day,
                   const time_duration_t& _time,
                   const time_duration_t& _offset)
  : day(_day), time(_time), offset(_offset)
{
  const long long ticks_per_day = time_duration_t(24, 0, 0).ticks();
  const long long ticks         = time.ticks();

  if (ticks < 0 || ticks >= ticks_per_day) {
    day  += floor_div(ticks, ticks_per_day);
    time  = time_duration_t(0, 0, 0, floor_mod(ticks, ticks_per_day));
  }
}

moment_t::moment_t(const datetime_t& local, const time_duration_t& _offset)
  : day(0), time(0, 0, 0), offset(_offset)
{
  if (local.is_special())
    throw_(datetime_error, _f("Invalid date/time: %1%") % local);

  day  = (local.date() - unix_epoch).days();
  time = local.time_of_day();
}

bool moment_t::is_representable() const
{
  long long year = date().year;
  return year >= min_ptime_year && year <= max_ptime_year;
}

datetime_t moment_t::local() const
{
  if (! is_representable())
    throw_(datetime_error,
           _f("Date out of range for a ptime: %1%") % date());

  civil_date_t civil = date();
  return datetime_t(date_t(static_cast<unsigned short>(civil.year),
                           static_cast<unsigned short>(civil.month),
                           static_cast<unsigned short>(civil.day)), time);
}

moment_t true_current_moment()
{
  typedef boost::date_time::c_local_adjustor<datetime_t> local_adjustor;

  datetime_t utc   = boost::posix_time::microsec_clock::universal_time();
  datetime_t local = local_adjustor::utc_to_local(utc);

  return moment_t(local, local - utc);
}

day_number_t normalized_day(long long year, long long month, long long day)
{
  long long months = month - 1;

  civil_date_t first(year + floor_div(months, 12),
                     static_cast<int>(floor_mod(months, 12) + 1), 1);

  return day_number(first) + day - 1;
}

moment_t normalized_moment(long long year, long long month, long long day,
                           long long hour, long long minute, long long second,
                           long long nanoseconds,
                           const time_duration_t& offset)
{
  long long secs = (hour * 3600 + minute * 60 + second +
                    floor_div(nanoseconds, nanos_per_second));
  long long nanos = floor_mod(nanoseconds, nanos_per_second);

  long long extra_days = floor_div(secs, seconds_per_day);
  secs = floor_mod(secs, seconds_per_day);

  moment_t when(normalized_day(year, month, day) + extra_days,
                time_duration_t(0, 0, 0, secs * nanos_per_second + nanos),
                offset);

  DEBUG("times.normalize",
        "(" << year << ", " << month << ", " << day << ", " << hour
        << ", " << minute << ", " << second << ", " << nanoseconds
        << ") -> " << when);

  return when;
}

int weekday_of(const day_number_t day)
{
  long long cycles;
  return reduced_date(day, cycles).day_of_week().as_number();
}

day_number_t first_day_of_month(const day_number_t day)
{
  return day - (civil_date(day).day - 1);
}

day_number_t last_day_of_month(const day_number_t day)
{
  civil_date_t date = civil_date(day);
  return day + (days_in_month(date.year, date.month) - date.day);
}

day_number_t first_day_of_year(const day_number_t day)
{
  return day_number(civil_date_t(civil_date(day).year, 1, 1));
}

moment_t parse_moment(const char * str)
{
  static const boost::regex moment_re(moment_pattern);

  string text(str);
  trim(text);

  boost::cmatch what;
  if (! boost::regex_match(text.c_str(), what, moment_re))
    throw_(datetime_error, _f("Invalid date/time: %1%") % str);

  int hour   = field(what, 4);
  int minute = field(what, 5);
  int second = field(what, 6);

  if (hour > 23 || minute > 59 || second > 59)
    throw_(datetime_error, _f("Invalid time of day: %1%") % str);

  long nanos = 0;
  if (what[7].matched) {
    string fraction = what[7].str();
    fraction.resize(9, '0');
    nanos = lexical_cast<long>(fraction);
  }

  civil_date_t date(lexical_cast<long long>(what[1].str()),
                    field(what, 2), field(what, 3));

  time_duration_t offset(0, 0, 0);
  if (what[9].matched) {
    int off_hours   = field(what, 10);
    int off_minutes = field(what, 11);
    if (off_hours > 23 || off_minutes > 59)
      throw_(datetime_error, _f("Invalid UTC offset: %1%") % str);

    offset = posix_time::hours(off_hours) + posix_time::minutes(off_minutes);
    if (what[9].str() == "-")
      offset = offset.invert_sign();
  }

  moment_t when(day_number(date),
                posix_time::hours(hour) + posix_time::minutes(minute) +
                posix_time::seconds(second) + posix_time::nanoseconds(nanos),
                offset);

  DEBUG("times.parse", "Parsed moment string: " << str);
  DEBUG("times.parse", "Parsed result is:     " << when);

  return when;
}

std::string format_offset(const time_duration_t& offset)
{
  if (offset.ticks() == 0)
    return "Z";

  time_duration_t magnitude = offset.is_negative() ? offset.invert_sign() : offset;

  std::ostringstream out;
  out << (offset.is_negative() ? '-' : '+')
      << std::setw(2) << std::setfill('0') << magnitude.hours() << ':'
      << std::setw(2) << std::setfill('0') << magnitude.minutes();
  if (magnitude.seconds() != 0)
    out << ':' << std::setw(2) << std::setfill('0') << magnitude.seconds();
  return out.str();
}

std::string format_moment(const moment_t& when)
{
  const time_duration_t& tod(when.time);

  std::ostringstream out;
  out << when.date() << 'T' << std::setfill('0')
      << std::setw(2) << tod.hours() << ':'
      << std::setw(2) << tod.minutes() << ':'
      << std::setw(2) << tod.seconds();

  long long nanos = tod.fractional_seconds();
  if (nanos != 0) {
    std::ostringstream frac;
    frac << std::setw(9) << std::setfill('0') << nanos;
    string digits = frac.str();
    digits.erase(digits.find_last_not_of('0') + 1);
    out << '.' << digits;
  }

  out << format_offset(when.offset);
  return out.str();
}

std::ostream& operator<<(std::ostream& out, const moment_t& when)
{
  out << format_moment(when);
  return out;
}

} // namespace timeshift
