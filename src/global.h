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
 * @file   global.h
 * @author timeshift contributors
 *
 * @brief Contains the top-level functions used by main.cc
 */
#ifndef _GLOBAL_H
#define _GLOBAL_H

#include "cache.h"

namespace timeshift {

class global_scope_t : public noncopyable
{
  shift_cache_t cache;

public:
  bool             show_tokens;
  bool             explain;
  bool             use_cache;
  optional<string> script_file;

  global_scope_t();

  /** Consume the options in args, returning what is left.  Options
      already seen by handle_debug_options are skipped here. */
  strings_list read_command_arguments(strings_list args);

  shift_ptr lookup_shift(const string& pattern);

  void report_error(const std::exception& err);

  /** args holds a pattern followed by zero or more timestamps. */
  void execute_command(strings_list args, std::ostream& out);
  int  execute_command_wrapper(strings_list args, std::ostream& out);

  int  execute_script(const path& script, std::ostream& out);

  const shift_cache_t& shift_cache() const {
    return cache;
  }
};

void handle_debug_options(int argc, char * argv[]);

} // namespace timeshift

#endif // _GLOBAL_H
