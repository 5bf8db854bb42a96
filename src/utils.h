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

/**
 * @defgroup util General utilities
 */

/**
 * @file   utils.h
 * @author timeshift contributors
 *
 * @ingroup util
 *
 * @brief General utility facilities used by timeshift
 */
#pragma once

/**
 * @name Forward declarations
 */
/*@{*/

namespace timeshift {
  using namespace boost;

  typedef std::string       string;
  typedef std::list<string> strings_list;

  typedef boost::filesystem::path     path;
  typedef boost::filesystem::ifstream ifstream;
}

/*@}*/

/**
 * @name Assertions
 */
/*@{*/

#ifdef assert
#undef assert
#endif

#if !NO_ASSERTS

namespace timeshift {
  void debug_assert(const string& reason, const string& func,
                    const string& file, std::size_t line);
}

#define assert(x)                                                  \
  ((x) ? ((void)0) : timeshift::debug_assert(#x, BOOST_CURRENT_FUNCTION, \
                                             __FILE__, __LINE__))

#else // !NO_ASSERTS

#define assert(x) ((void)(x))

#endif // !NO_ASSERTS

/*@}*/

/**
 * @name Tracing and logging
 *
 * The log buffer is per thread, so that shifts may be parsed and
 * applied from several threads while debugging output is enabled.
 */
/*@{*/

namespace timeshift {

enum log_level_t {
  LOG_OFF = 0,
  LOG_WARN,
  LOG_INFO,
  LOG_DEBUG,
  LOG_TRACE
};

extern log_level_t                     _log_level;
extern std::ostream *                  _log_stream;
extern thread_local std::ostringstream _log_buffer;

void logger_func(log_level_t level);

#if TRACING_ON

extern uint16_t _trace_level;

#define SHOW_TRACE(lvl) \
  (timeshift::_log_level >= timeshift::LOG_TRACE && \
   lvl <= timeshift::_trace_level)
#define TRACE(lvl, msg) \
  (SHOW_TRACE(lvl) ? \
   ((timeshift::_log_buffer << msg), \
    timeshift::logger_func(timeshift::LOG_TRACE)) : (void)0)

#else // TRACING_ON

#define TRACE(lvl, msg)

#endif // TRACING_ON

#if DEBUG_ON

extern optional<std::string> _log_category;

bool category_matches(const char * cat);

#define SHOW_DEBUG(cat) \
  (timeshift::_log_level >= timeshift::LOG_DEBUG && \
   timeshift::category_matches(cat))

#define DEBUG(cat, msg) \
  (SHOW_DEBUG(cat) ? \
   ((timeshift::_log_buffer << msg), \
    timeshift::logger_func(timeshift::LOG_DEBUG)) : (void)0)

#else // DEBUG_ON

#define DEBUG(cat, msg)

#endif // DEBUG_ON

#define LOG_MACRO(level, msg) \
  (timeshift::_log_level >= level ? \
   ((timeshift::_log_buffer << msg), timeshift::logger_func(level)) : (void)0)

#define SHOW_INFO() (timeshift::_log_level >= timeshift::LOG_INFO)

#define INFO(msg) LOG_MACRO(timeshift::LOG_INFO, msg)

} // namespace timeshift

/*@}*/

/**
 * @name Timers
 *
 * Timers report the time spent between a start and a finish, in the
 * log line of the finish.
 */
/*@{*/

namespace timeshift {

void start_timer(const char * name, log_level_t lvl);
void finish_timer(const char * name);

#define INFO_START(name, msg) \
  (SHOW_INFO() ? \
   ((timeshift::_log_buffer << msg), \
    timeshift::start_timer(#name, timeshift::LOG_INFO)) : ((void)0))
#define INFO_FINISH(name) \
  (SHOW_INFO() ? timeshift::finish_timer(#name) : ((void)0))

} // namespace timeshift

/*@}*/

/*
 * These files define the other internal facilities.
 */

#include "error.h"

/**
 * @name General utility functions
 */
/*@{*/

#define foreach BOOST_FOREACH

namespace timeshift {

extern string empty_string;

strings_list split_arguments(const char * line);

path resolve_path(const path& pathname);

inline bool is_blank(const string& str) {
  foreach (char c, str)
    if (! std::isspace(static_cast<unsigned char>(c)))
      return false;
  return true;
}

} // namespace timeshift

/*@}*/
