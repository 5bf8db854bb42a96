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
 * @file   cache.h
 * @author timeshift contributors
 *
 * @ingroup shift
 *
 * @brief Parsed shift patterns, kept by pattern text
 *
 * Lookups share the lock, so any number of readers proceed together.
 * Patterns are parsed outside the lock; when two threads race to store
 * the same pattern, the first one published is kept and handed to both.
 * Patterns that fail to parse are never stored.
 */
#ifndef _CACHE_H
#define _CACHE_H

#include "shift.h"

namespace timeshift {

class shift_cache_t : public noncopyable
{
  typedef std::map<string, shift_ptr> shifts_map;

  mutable std::shared_mutex mutex;
  shifts_map                shifts;

public:
  shift_cache_t() {}

  shift_ptr find(const string& pattern) const;

  /** Store a parsed shift unless the pattern is already present.  Returns
      whichever entry the cache holds afterwards. */
  shift_ptr insert(const string& pattern, const shift_ptr& shift);

  std::size_t size() const;
  void        clear();
};

/** Parse a pattern through a cache.  Leading and trailing white space is
    not part of the key, and blank patterns are never stored. */
shift_ptr parse_shift(const string& pattern, shift_cache_t& cache);

} // namespace timeshift

#endif // _CACHE_H
