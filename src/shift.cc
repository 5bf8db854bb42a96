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

#include "shift.h"

namespace timeshift {

const char * const shift_t::unit_letters = "YMDWwhmslun";

const char * shift_t::unit_name(unit_t unit)
{
  switch (unit) {
  case YEAR:        return "year";
  case MONTH:       return "month";
  case DAY:         return "day";
  case WEEK:        return "week";
  case WEEKDAY:     return "weekday";
  case HOUR:        return "hour";
  case MINUTE:      return "minute";
  case SECOND:      return "second";
  case MILLISECOND: return "millisecond";
  case MICROSECOND: return "microsecond";
  case NANOSECOND:  return "nanosecond";
  case UNIT_COUNT:  break;
  }
  assert(false);
  return "";
}

namespace {
  // Only the most recent failed parse is described, so a thread that
  // never reads the context does not keep collecting it.
  void replace_error_context(const string& context) {
    error_context();
    add_error_context(context);
  }
}

class shift_parser_t
{
  friend void show_shift_tokens(std::ostream& out, const string& pattern);

  class lexer_t
  {
    friend class shift_parser_t;

    string::const_iterator start;
    string::const_iterator begin;
    string::const_iterator end;

  public:
    struct token_t
    {
      enum kind_t {
        UNKNOWN,
        TOK_CLAUSE,
        END_REACHED
      } kind;

      char              unit;
      string            anchors;
      char              sign;
      string            digits;
      string            text;
      string::size_type pos;

      explicit token_t(kind_t _kind = UNKNOWN)
        : kind(_kind), unit('\0'), sign('\0'), pos(0) {}

      operator bool() const {
        return kind != END_REACHED;
      }

      string to_string() const {
        switch (kind) {
        case UNKNOWN:     return "<unknown>";
        case TOK_CLAUSE:  return text;
        case END_REACHED: return "<EOF>";
        }
        return empty_string;
      }

      void dump(std::ostream& out) const {
        switch (kind) {
        case UNKNOWN:     out << "UNKNOWN"; break;
        case TOK_CLAUSE:
          out << "TOK_CLAUSE unit=" << unit;
          if (! anchors.empty())
            out << " anchor=" << anchors;
          if (sign)
            out << " sign=" << sign;
          out << " digits=" << digits << " at " << pos;
          break;
        case END_REACHED: out << "END_REACHED"; break;
        }
      }
    };

    lexer_t(string::const_iterator _begin,
            string::const_iterator _end)
      : start(_begin), begin(_begin), end(_end) {}

    token_t next_token();

  private:
    void unexpected(string::const_iterator where, const char * wanted);
  };

  typedef lexer_t::token_t token_t;

  string  arg;
  lexer_t lexer;

public:
  shift_parser_t(const string& _arg)
    : arg(_arg), lexer(arg.begin(), arg.end()) {}
  shift_parser_t(const shift_parser_t& parser)
    : arg(parser.arg), lexer(arg.begin(), arg.end()) {}

  shift_t parse();

private:
  part_def_t make_part(shift_t::unit_t unit, const token_t& tok);
  int        magnitude(const token_t& tok);

  void mark(const token_t& tok) {
    replace_error_context(line_context(arg, tok.pos,
                                       tok.pos + tok.text.length()));
  }
};

shift_parser_t::lexer_t::token_t shift_parser_t::lexer_t::next_token()
{
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin)))
    begin++;

  if (begin == end)
    return token_t(token_t::END_REACHED);

  token_t tok(token_t::TOK_CLAUSE);
  string::const_iterator clause = begin;

  if (! std::strchr(shift_t::unit_letters, *begin) || *begin == '\0')
    unexpected(begin, _("a unit letter"));
  tok.unit = *begin++;

  // A run of anchors is accepted here so that the builder can name the
  // conflict; a clause may use at most one of them.
  while (begin != end && (*begin == '^' || *begin == '$'))
    tok.anchors.push_back(*begin++);

  if (begin != end && (*begin == '+' || *begin == '-'))
    tok.sign = *begin++;

  while (begin != end && std::isdigit(static_cast<unsigned char>(*begin)))
    tok.digits.push_back(*begin++);

  if (tok.digits.empty())
    unexpected(begin, _("a number"));

  tok.text = string(clause, begin);
  tok.pos  = static_cast<string::size_type>(clause - start);

  return tok;
}

void shift_parser_t::lexer_t::unexpected(string::const_iterator where,
                                         const char * wanted)
{
  string pattern(start, end);
  string::size_type pos = static_cast<string::size_type>(where - start);

  replace_error_context(line_context(pattern, pos));

  if (where == end)
    throw_(shift_syntax_error,
           _f("Illegal pattern \"%1%\": expected %2% at end of pattern")
           % pattern % wanted);
  else
    throw_(shift_syntax_error,
           _f("Illegal pattern \"%1%\": expected %2%, found '%3%'")
           % pattern % wanted % *where);
}

int shift_parser_t::magnitude(const token_t& tok)
{
  long long value = 0;
  foreach (char digit, tok.digits) {
    value = value * 10 + (digit - '0');
    if (value > std::numeric_limits<int>::max()) {
      mark(tok);
      throw_(shift_value_error,
             _f("Value out of range in \"%1%\"") % tok.text);
    }
  }
  return static_cast<int>(value);
}

part_def_t shift_parser_t::make_part(shift_t::unit_t unit,
                                     const token_t& tok)
{
  part_def_t part;

  part.active = true;
  part.value  = magnitude(tok);

  switch (tok.sign) {
  case '+':
    part.absolute = false;
    break;
  case '-':
    part.absolute = false;
    part.value    = -part.value;
    break;
  default:
    break;
  }

  foreach (char option, tok.anchors) {
    switch (option) {
    case '^':
      if (unit != shift_t::WEEK) {
        mark(tok);
        throw_(shift_option_error,
               _f("Illegal option '%1%' in \"%2%\"") % option % tok.text);
      }
      if (part.from_begin) {
        mark(tok);
        throw_(shift_option_error,
               _f("Repeated option '%1%' in \"%2%\"") % option % tok.text);
      }
      part.from_begin = true;
      break;

    case '$':
      if (unit != shift_t::DAY && unit != shift_t::WEEK) {
        mark(tok);
        throw_(shift_option_error,
               _f("Illegal option '%1%' in \"%2%\"") % option % tok.text);
      }
      if (part.from_end) {
        mark(tok);
        throw_(shift_option_error,
               _f("Repeated option '%1%' in \"%2%\"") % option % tok.text);
      }
      part.from_end = true;
      break;

    default:
      assert(false);
      break;
    }
  }

  if (part.is_anchored() && ! part.absolute) {
    mark(tok);
    throw_(shift_option_error,
           _f("\"^\" and \"$\" cannot be used with relative (\"+\" or \"-\") "
              "values in \"%1%\"") % tok.text);
  }

  if (part.from_begin && part.from_end) {
    mark(tok);
    throw_(shift_option_error,
           _f("\"^\" and \"$\" cannot be used together in \"%1%\"")
           % tok.text);
  }

  switch (unit) {
  case shift_t::MONTH:
    if (part.absolute && part.value == 0) {
      mark(tok);
      throw_(shift_value_error, _f("Illegal month in \"%1%\"") % tok.text);
    }
    break;

  case shift_t::DAY:
    if (part.absolute && part.value == 0) {
      mark(tok);
      throw_(shift_value_error, _f("Illegal day in \"%1%\"") % tok.text);
    }
    break;

  case shift_t::WEEK:
    // W+0 and W-0 are fine: no shift, but the weekday is still resolved
    if (part.is_anchored() && part.value == 0) {
      mark(tok);
      throw_(shift_value_error,
             _f("Illegal anchored week in \"%1%\"") % tok.text);
    }
    else if (part.absolute && part.value == 0) {
      mark(tok);
      throw_(shift_value_error,
             _f("Illegal absolute week in \"%1%\"") % tok.text);
    }
    break;

  case shift_t::WEEKDAY:
    if (part.value < 0 || part.value > 6) {
      mark(tok);
      throw_(shift_value_error,
             _f("Illegal weekday in \"%1%\" (0 is Sunday, 6 is Saturday)")
             % tok.text);
    }
    break;

  default:
    break;
  }

  return part;
}

shift_t shift_parser_t::parse()
{
  shift_t shift;

  if (is_blank(arg)) {
    DEBUG("shift.parse", "Blank pattern, using the identity shift");
    return shift;
  }

  // The whole pattern must scan before any clause is checked, so that a
  // malformed pattern is always reported as such.
  std::vector<token_t> tokens;
  while (token_t tok = lexer.next_token()) {
    DEBUG("shift.parse", "Scanned clause: " << tok.to_string());
    tokens.push_back(tok);
  }

  shift.empty = false;

  const char * cursor = shift_t::unit_letters;

  foreach (const token_t& tok, tokens) {
    const char * expected = cursor;

    while (*cursor && *cursor != tok.unit)
      cursor++;

    if (! *cursor) {
      mark(tok);
      if (*expected)
        throw_(shift_sequence_error,
               _f("Wrong sequence of units in \"%1%\" (at \"%2%\"), "
                  "expected one of \"%3%\"") % arg % tok.text % expected);
      else
        throw_(shift_sequence_error,
               _f("Wrong sequence of units in \"%1%\" (at \"%2%\"), "
                  "expected end of pattern") % arg % tok.text);
    }

    shift_t::unit_t unit =
      static_cast<shift_t::unit_t>(cursor - shift_t::unit_letters);
    cursor++;

    shift.parts[unit] = make_part(unit, tok);

    DEBUG("shift.parse", shift_t::unit_name(unit) << " <- " << tok.text);
  }

  return shift;
}

shift_t::shift_t(const string& pattern) : empty(true)
{
  *this = shift_parser_t(pattern).parse();
}

shift_t parse_shift(const string& pattern)
{
  return shift_parser_t(pattern).parse();
}

bool shift_t::operator==(const shift_t& other) const
{
  if (empty != other.empty)
    return false;
  for (int i = 0; i < UNIT_COUNT; i++)
    if (parts[i] != other.parts[i])
      return false;
  return true;
}

namespace {
  // The fields set or moved during substitution, in the order they are
  // adjusted.  Week and weekday are resolved afterwards.
  const shift_t::unit_t substituted_units[] = {
    shift_t::YEAR,
    shift_t::MONTH,
    shift_t::DAY,
    shift_t::HOUR,
    shift_t::MINUTE,
    shift_t::SECOND,
    shift_t::MILLISECOND,
    shift_t::MICROSECOND,
    shift_t::NANOSECOND
  };

  inline long long adjust(const part_def_t& part, long long field)
  {
    if (! part.active)
      return field;
    if (part.from_end)
      return field;             // settled once the month is known
    if (part.absolute)
      return part.value;
    return field + part.value;
  }
}

moment_t shift_t::apply(const moment_t& when) const
{
  if (empty)
    return when;

  civil_date_t    date = when.date();
  time_duration_t tod  = when.time_of_day();
  long long       frac = tod.fractional_seconds();

  long long fields[UNIT_COUNT] = { 0 };

  fields[YEAR]        = date.year;
  fields[MONTH]       = date.month;
  fields[DAY]         = date.day;
  fields[HOUR]        = tod.hours();
  fields[MINUTE]      = tod.minutes();
  fields[SECOND]      = tod.seconds();
  fields[MILLISECOND] = frac / 1000000;
  fields[MICROSECOND] = (frac / 1000) % 1000;
  fields[NANOSECOND]  = frac % 1000;

  const long long original_day = fields[DAY];

  foreach (unit_t unit, substituted_units)
    fields[unit] = adjust(parts[unit], fields[unit]);

  TRACE(1, "Substituted fields: " << fields[YEAR] << '-' << fields[MONTH]
        << '-' << fields[DAY] << ' ' << fields[HOUR] << ':' << fields[MINUTE]
        << ':' << fields[SECOND] << " +" << fields[MILLISECOND] << "ms +"
        << fields[MICROSECOND] << "us +" << fields[NANOSECOND] << "ns");

  moment_t result =
    normalized_moment(fields[YEAR], fields[MONTH], fields[DAY],
                      fields[HOUR], fields[MINUTE], fields[SECOND],
                      fields[MILLISECOND] * 1000000LL +
                      fields[MICROSECOND] * 1000LL +
                      fields[NANOSECOND], when.offset);

  DEBUG("shift.apply", "Substituted " << when << " -> " << result);

  if (parts[DAY].active && parts[DAY].from_end) {
    // The first of next month, less the requested number of days.  Any
    // day carried in from the clock is kept.
    civil_date_t candidate = result.date();
    result.day = normalized_day(candidate.year, candidate.month + 1,
                                candidate.day + 1 - original_day -
                                parts[DAY].value);

    TRACE(1, "Counted day from end of month: " << result);
  }

  result = resolve_week(result);

  DEBUG("shift.apply", "Shifted " << when << " by \""
        << to_string() << "\" to " << result);

  return result;
}

moment_t shift_t::resolve_week(moment_t result) const
{
  const part_def_t& week    = parts[WEEK];
  const part_def_t& weekday = parts[WEEKDAY];

  if (week.active) {
    const int wd = weekday.active ? weekday.value : weekday_of(result.day);

    if (week.from_begin) {
      day_number_t first = first_day_of_month(result.day);

      long long shift = wd - weekday_of(first);
      if (shift < 0)
        shift += 7;
      shift += (week.value - 1) * 7LL;

      result.day = first + shift;
      TRACE(1, "Counted week from start of month: " << result);
      return result;
    }

    if (week.from_end) {
      day_number_t last = last_day_of_month(result.day);

      long long shift = wd - weekday_of(last);
      if (shift > 0)
        shift -= 7;
      shift -= (week.value - 1) * 7LL;

      result.day = last + shift;
      TRACE(1, "Counted week from end of month: " << result);
      return result;
    }

    if (week.absolute) {
      // Occurrences of the weekday counted from January 1, not ISO weeks
      day_number_t jan1 = first_day_of_year(result.day);

      long long shift = wd - weekday_of(jan1);
      if (shift < 0)
        shift += 7;
      shift += (week.value - 1) * 7LL;

      result.day = jan1 + shift;
      TRACE(1, "Counted week from start of year: " << result);
      return result;
    }

    result.day += week.value * 7LL;
    TRACE(1, "Moved by " << week.value << " weeks: " << result);
  }

  // Snap within the current Sunday-based week; this may move backward.
  if (weekday.active) {
    result.day += weekday.value - weekday_of(result.day);
    TRACE(1, "Snapped to weekday " << weekday.value << ": " << result);
  }

  return result;
}

string shift_t::to_string() const
{
  std::ostringstream out;
  bool first = true;

  for (int i = 0; i < UNIT_COUNT; i++) {
    const part_def_t& def(parts[i]);
    if (! def.active)
      continue;

    if (first)
      first = false;
    else
      out << ' ';

    out << unit_letters[i];
    if (def.from_begin)
      out << '^';
    if (def.from_end)
      out << '$';
    if (! def.absolute)
      out << (def.value < 0 ? '-' : '+');
    out << (def.value < 0 ? -long(def.value) : long(def.value));
  }

  return out.str();
}

void shift_t::dump(std::ostream& out) const
{
  if (empty) {
    out << "identity" << std::endl;
    return;
  }

  for (int i = 0; i < UNIT_COUNT; i++) {
    const part_def_t& def(parts[i]);
    if (! def.active)
      continue;

    out << std::left << std::setw(13)
        << (string(unit_name(unit_t(i))) + ":") << std::right;

    if (def.from_begin)
      out << "from begin ";
    else if (def.from_end)
      out << "from end ";
    else if (def.absolute)
      out << "set to ";
    else
      out << "move by ";

    out << def.value << std::endl;
  }
}

std::ostream& operator<<(std::ostream& out, const shift_t& shift)
{
  out << shift.to_string();
  return out;
}

void show_shift_tokens(std::ostream& out, const string& pattern)
{
  shift_parser_t::lexer_t lexer(pattern.begin(), pattern.end());

  out << _("--- Shift pattern tokens ---") << std::endl;

  shift_parser_t::token_t token;
  do {
    token = lexer.next_token();
    token.dump(out);
    out << ": " << token.to_string() << std::endl;
  }
  while (token.kind != shift_parser_t::token_t::END_REACHED);
}

} // namespace timeshift
