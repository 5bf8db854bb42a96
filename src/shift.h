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
 * @addtogroup shift
 */

/**
 * @file   shift.h
 * @author timeshift contributors
 *
 * @ingroup shift
 *
 * @brief Calendar-relative time shift patterns
 *
 * A shift pattern is a run of clauses, one per calendar unit, in the
 * fixed order Y M D W w h m s l u n:
 *
 *   Y2021 M+2 D$1 h6 m0 s0     set the year, go two months ahead, take
 *                              the last day of that month at 06:00:00
 *   W^1 w0                     the first Sunday of the month
 *   W+2 w1                     the Monday two weeks from now
 *
 * A clause is a unit letter, an optional anchor ('^' from the start of
 * the period, '$' from its end), an optional sign ('+' or '-' makes the
 * value relative) and a decimal magnitude.  A blank pattern is the
 * identity shift.
 *
 * A pattern that fails to parse throws a shift_error and leaves a caret
 * line marking the clause as the pending error_context(), replacing any
 * context a previous failure left behind.
 */
#ifndef _SHIFT_H
#define _SHIFT_H

#include "times.h"

namespace timeshift {

DECLARE_EXCEPTION(shift_error, std::runtime_error);
DECLARE_EXCEPTION(shift_syntax_error, shift_error);
DECLARE_EXCEPTION(shift_sequence_error, shift_error);
DECLARE_EXCEPTION(shift_option_error, shift_error);
DECLARE_EXCEPTION(shift_value_error, shift_error);

struct part_def_t : public equality_comparable<part_def_t>
{
  bool active;
  int  value;
  bool absolute;                // false: value is added to the field
  bool from_begin;              // '^', week only
  bool from_end;                // '$', day and week only

  part_def_t()
    : active(false), value(0), absolute(true),
      from_begin(false), from_end(false) {}

  bool is_anchored() const {
    return from_begin || from_end;
  }

  bool operator==(const part_def_t& other) const {
    return (active     == other.active &&
            value      == other.value &&
            absolute   == other.absolute &&
            from_begin == other.from_begin &&
            from_end   == other.from_end);
  }
};

class shift_t : public equality_comparable<shift_t>
{
  friend class shift_parser_t;

public:
  enum unit_t {
    YEAR,
    MONTH,
    DAY,
    WEEK,
    WEEKDAY,
    HOUR,
    MINUTE,
    SECOND,
    MILLISECOND,
    MICROSECOND,
    NANOSECOND,
    UNIT_COUNT
  };

  /** The unit letters, in the only order a pattern may use them. */
  static const char * const unit_letters;

  static const char * unit_name(unit_t unit);

protected:
  bool       empty;
  part_def_t parts[UNIT_COUNT];

public:
  shift_t() : empty(true) {}
  explicit shift_t(const string& pattern);

  bool is_empty() const {
    return empty;
  }

  const part_def_t& part(unit_t unit) const {
    return parts[unit];
  }
  const part_def_t& operator[](unit_t unit) const {
    return parts[unit];
  }

  bool operator==(const shift_t& other) const;

  /** Apply the shift to a moment.  This never fails.  The result keeps
      the offset of the argument; an empty shift returns the argument
      untouched. */
  moment_t apply(const moment_t& when) const;

  /** Canonical pattern text; parsing it yields an equal shift. */
  string to_string() const;

  void dump(std::ostream& out) const;

private:
  moment_t resolve_week(moment_t result) const;
};

typedef shared_ptr<const shift_t> shift_ptr;

std::ostream& operator<<(std::ostream& out, const shift_t& shift);

shift_t parse_shift(const string& pattern);

void show_shift_tokens(std::ostream& out, const string& pattern);

} // namespace timeshift

#endif // _SHIFT_H
