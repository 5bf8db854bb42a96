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

#include "global.h"

namespace timeshift {

global_scope_t::global_scope_t()
  : show_tokens(false), explain(false), use_cache(true)
{
}

strings_list global_scope_t::read_command_arguments(strings_list args)
{
  strings_list remaining;
  bool         options_done = false;

  for (strings_list::iterator i = args.begin(); i != args.end(); i++) {
    const string& arg(*i);

    if (options_done || arg.length() < 2 || arg[0] != '-') {
      remaining.push_back(arg);
      continue;
    }

    if (arg == "--") {
      options_done = true;
      continue;
    }

    strings_list::iterator next = i;
    next++;
    bool have_value = next != args.end();

    if (arg == "--verbose" || arg == "-v") {
      // handled by handle_debug_options
    }
    else if (arg == "--debug" || arg == "--trace") {
      if (have_value)
        i = next;
    }
    else if (arg == "--tokens") {
      show_tokens = true;
    }
    else if (arg == "--explain") {
      explain = true;
    }
    else if (arg == "--no-cache") {
      use_cache = false;
    }
    else if (arg == "--now") {
      if (! have_value)
        throw_(std::logic_error, _f("Missing argument to %1%") % arg);
      epoch = parse_moment(*next);
      i = next;
    }
    else if (arg == "--script") {
      if (! have_value)
        throw_(std::logic_error, _f("Missing argument to %1%") % arg);
      script_file = *next;
      i = next;
    }
    else {
      throw_(std::logic_error, _f("Illegal option %1%") % arg);
    }
  }

  return remaining;
}

shift_ptr global_scope_t::lookup_shift(const string& pattern)
{
  if (use_cache)
    return parse_shift(pattern, cache);
  else
    return shift_ptr(new shift_t(parse_shift(pattern)));
}

void global_scope_t::report_error(const std::exception& err)
{
  std::cout.flush();            // first display anything that was pending

  // Display any pending error context information
  string context = error_context();
  if (! context.empty())
    std::cerr << context << std::endl;

  std::cerr << _("Error: ") << err.what() << std::endl;
}

void global_scope_t::execute_command(strings_list args, std::ostream& out)
{
  if (args.empty())
    throw std::logic_error(_("Usage: timeshift [options] PATTERN [TIMESTAMP...]"));

  string pattern = args.front();
  args.pop_front();

  if (show_tokens)
    show_shift_tokens(out, pattern);

  shift_ptr shift = lookup_shift(pattern);

  if (explain) {
    out << _("--- Shift \"") << *shift << "\" ---" << std::endl;
    shift->dump(out);
  }

  if (args.empty()) {
    out << shift->apply(CURRENT_MOMENT()) << std::endl;
  } else {
    foreach (const string& timestamp, args)
      out << shift->apply(parse_moment(timestamp)) << std::endl;
  }
}

int global_scope_t::execute_command_wrapper(strings_list args,
                                            std::ostream& out)
{
  int status = 1;

  try {
    execute_command(args, out);
    status = 0;
  }
  catch (const std::exception& err) {
    report_error(err);
  }

  return status;
}

int global_scope_t::execute_script(const path& script, std::ostream& out)
{
  path pathname = resolve_path(script);

  ifstream in(pathname);
  if (! in.is_open())
    throw_(std::runtime_error,
           _f("Could not open script file %1%") % pathname);

  INFO_START(script, "Running script " << pathname);

  std::size_t linenum = 0;
  string      line;
  int         status  = 0;

  while (status == 0 && std::getline(in, line)) {
    linenum++;

    string text = trim_copy(line);
    if (text.empty() || text[0] == '#')
      continue;

    try {
      execute_command(split_arguments(text.c_str()), out);
    }
    catch (const std::exception& err) {
      string context = error_context();
      add_error_context(file_context(pathname, linenum));
      if (! context.empty())
        add_error_context(context);
      report_error(err);
      status = 1;
    }
  }

  INFO_FINISH(script);

  DEBUG("shift.cache", "Script left " << cache.size()
        << " patterns in the cache");

  return status;
}

void handle_debug_options(int argc, char * argv[])
{
  for (int i = 1; i < argc; i++) {
    if (argv[i][0] == '-') {
      if (std::strcmp(argv[i], "--verbose") == 0 ||
          std::strcmp(argv[i], "-v") == 0) {
        _log_level = LOG_INFO;
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--debug") == 0) {
#if DEBUG_ON
        _log_level    = LOG_DEBUG;
        _log_category = argv[i + 1];
        i++;
#endif
      }
      else if (i + 1 < argc && std::strcmp(argv[i], "--trace") == 0) {
#if TRACING_ON
        _log_level   = LOG_TRACE;
        try {
          _trace_level = boost::lexical_cast<uint16_t>(argv[i + 1]);
        }
        catch (const boost::bad_lexical_cast&) {
          throw std::logic_error(_("Argument to --trace must be an integer"));
        }
        i++;
#endif
      }
      else if (std::strcmp(argv[i], "--") == 0) {
        break;
      }
    }
  }
}

} // namespace timeshift
