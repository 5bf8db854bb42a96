/*
 * Copyright (c) 2003-2023, John Wiegley.  All rights reserved.
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
 * - Neither the name of New Artisans LLC nor the names of its
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

/**********************************************************************
 *
 * Assertions
 */

#if !NO_ASSERTS

namespace timeshift {

DECLARE_EXCEPTION(assertion_failed, std::logic_error);

void debug_assert(const string& reason,
                  const string& func,
                  const string& file,
                  std::size_t   line)
{
  std::ostringstream buf;
  buf << "Assertion failed in " << file_context(file, line)
      << func << ": " << reason;
  throw assertion_failed(buf.str());
}

} // namespace timeshift

#endif

/**********************************************************************
 *
 * String wrapper
 */

namespace timeshift {

string empty_string("");

strings_list split_arguments(const char * line)
{
  strings_list args;

  string buf;
  bool   have_arg         = false;
  char   in_quoted_string = '\0';

  for (const char * p = line; *p; p++) {
    if (! in_quoted_string && std::isspace(static_cast<unsigned char>(*p))) {
      if (have_arg) {
        args.push_back(buf);
        buf.clear();
        have_arg = false;
      }
    }
    else if (in_quoted_string != '\'' && *p == '\\') {
      p++;
      if (! *p)
        throw_(std::logic_error, _("Invalid use of backslash"));
      buf.push_back(*p);
      have_arg = true;
    }
    else if (in_quoted_string != '"' && *p == '\'') {
      if (in_quoted_string == '\'')
        in_quoted_string = '\0';
      else
        in_quoted_string = '\'';
      have_arg = true;
    }
    else if (in_quoted_string != '\'' && *p == '"') {
      if (in_quoted_string == '"')
        in_quoted_string = '\0';
      else
        in_quoted_string = '"';
      have_arg = true;
    }
    else {
      buf.push_back(*p);
      have_arg = true;
    }
  }

  if (in_quoted_string)
    throw_(std::logic_error,
           _f("Unterminated string, expected '%1%'") % in_quoted_string);

  if (have_arg)
    args.push_back(buf);

  return args;
}

} // namespace timeshift

/**********************************************************************
 *
 * Logging
 */

namespace timeshift {

log_level_t                     _log_level  = LOG_WARN;
std::ostream *                  _log_stream = &std::cerr;
thread_local std::ostringstream _log_buffer;

#if TRACING_ON
uint16_t _trace_level;
#endif

namespace {
  std::mutex logger_mutex;
  bool       logger_has_run = false;
  datetime_t logger_start;
}

void logger_func(log_level_t level)
{
  std::lock_guard<std::mutex> guard(logger_mutex);

  if (! logger_has_run) {
    logger_has_run = true;
    logger_start   = TRUE_CURRENT_TIME();
  }

  *_log_stream << std::right << std::setw(5)
               << (TRUE_CURRENT_TIME() -
                   logger_start).total_milliseconds() << "ms";

  *_log_stream << "  " << std::left << std::setw(7);

  switch (level) {
  case LOG_WARN:  *_log_stream << "[WARN]"; break;
  case LOG_INFO:  *_log_stream << "[INFO]"; break;
  case LOG_DEBUG: *_log_stream << "[DEBUG]"; break;
  case LOG_TRACE: *_log_stream << "[TRACE]"; break;

  case LOG_OFF:
    assert(false);
    break;
  }

  *_log_stream << ' ' << _log_buffer.str() << std::endl;
  _log_buffer.clear();
  _log_buffer.str("");
}

} // namespace timeshift

#if DEBUG_ON

namespace timeshift {

optional<std::string> _log_category;

namespace {
  std::mutex             category_mutex;
  optional<boost::regex> log_category_re;
  std::string            log_category_source;
}

bool category_matches(const char * cat)
{
  if (! _log_category)
    return false;

  std::lock_guard<std::mutex> guard(category_mutex);

  // The category may be changed by --debug after the first match.
  if (! log_category_re || log_category_source != *_log_category) {
    log_category_re     = boost::regex(_log_category->c_str(),
                                       boost::regex::perl | boost::regex::icase);
    log_category_source = *_log_category;
  }
  return boost::regex_search(cat, *log_category_re);
}

static struct __maybe_enable_debugging {
  __maybe_enable_debugging() {
    if (const char * p = std::getenv("TIMESHIFT_DEBUG")) {
      _log_level    = LOG_DEBUG;
      _log_category = p;
    }
  }
} __maybe_enable_debugging_obj;

} // namespace timeshift

#endif // DEBUG_ON

/**********************************************************************
 *
 * Timers (allows log entries to specify cumulative time spent)
 */

namespace timeshift {

struct timer_t
{
  log_level_t level;
  datetime_t  begin;
  std::string description;

  timer_t(log_level_t _level, std::string _description)
    : level(_level), begin(TRUE_CURRENT_TIME()),
      description(_description) {}
};

typedef std::map<std::string, timer_t> timer_map;

namespace {
  std::mutex timers_mutex;
  timer_map  timers;
}

void start_timer(const char * name, log_level_t lvl)
{
  {
    std::lock_guard<std::mutex> guard(timers_mutex);

    timer_map::iterator i = timers.find(name);
    if (i == timers.end())
      timers.insert(timer_map::value_type(name, timer_t(lvl, _log_buffer.str())));
    else
      (*i).second.begin = TRUE_CURRENT_TIME();
  }
  _log_buffer.clear();
  _log_buffer.str("");
}

void finish_timer(const char * name)
{
  log_level_t level;
  {
    std::lock_guard<std::mutex> guard(timers_mutex);

    timer_map::iterator i = timers.find(name);
    if (i == timers.end())
      return;

    const string&   description((*i).second.description);
    time_duration_t spent = TRUE_CURRENT_TIME() - (*i).second.begin;

    _log_buffer << description << ' ';

    bool need_paren =
      description.empty() || description[description.size() - 1] != ':';

    if (need_paren)
      _log_buffer << '(';

    _log_buffer << spent.total_milliseconds() << "ms";

    if (need_paren)
      _log_buffer << ')';

    level = (*i).second.level;
    timers.erase(i);
  }
  logger_func(level);
}

} // namespace timeshift

/**********************************************************************
 *
 * General utility functions
 */

namespace timeshift {

namespace {
  path expand_path(const path& pathname)
  {
    std::string       path_string = pathname.string();
    string::size_type pos         = path_string.find_first_of('/');

    // Only "~" and "~/..." are expanded; "~user" is left alone.
    if (! (path_string.length() == 1 || pos == 1))
      return pathname;

    const char * pfx = std::getenv("HOME");
    if (! pfx)
      return pathname;

    string result(pfx);
    if (pos == string::npos)
      return result;

    if (result.empty() || result[result.length() - 1] != '/')
      result += '/';
    result += path_string.substr(pos + 1);

    return result;
  }
}

path resolve_path(const path& pathname)
{
  path temp = pathname;
  if (! temp.empty() && temp.string()[0] == '~')
    temp = expand_path(temp);
  return temp.lexically_normal();
}

} // namespace timeshift
