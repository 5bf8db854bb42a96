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

#include "cache.h"

namespace timeshift {

shift_ptr shift_cache_t::find(const string& pattern) const
{
  std::shared_lock<std::shared_mutex> lock(mutex);

  shifts_map::const_iterator i = shifts.find(pattern);
  if (i != shifts.end())
    return (*i).second;
  return shift_ptr();
}

shift_ptr shift_cache_t::insert(const string& pattern, const shift_ptr& shift)
{
  assert(shift);

  std::unique_lock<std::shared_mutex> lock(mutex);

  std::pair<shifts_map::iterator, bool> result =
    shifts.insert(shifts_map::value_type(pattern, shift));
  if (! result.second)
    DEBUG("shift.cache", "Pattern \"" << pattern
          << "\" was stored by another thread");

  return (*result.first).second;
}

std::size_t shift_cache_t::size() const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  return shifts.size();
}

void shift_cache_t::clear()
{
  std::unique_lock<std::shared_mutex> lock(mutex);
  shifts.clear();
}

shift_ptr parse_shift(const string& pattern, shift_cache_t& cache)
{
  static const shift_ptr identity(new shift_t);

  string key(pattern);
  trim(key);

  if (key.empty())
    return identity;

  if (shift_ptr shift = cache.find(key)) {
    DEBUG("shift.cache", "Found \"" << key << "\" in the cache");
    return shift;
  }

  DEBUG("shift.cache", "Parsing \"" << key << "\" for the cache");

  // A failed parse throws before anything reaches the cache.
  shift_ptr shift(new shift_t(parse_shift(key)));

  return cache.insert(key, shift);
}

} // namespace timeshift
