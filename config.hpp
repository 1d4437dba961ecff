/*

    Copyright the Structured authors, 2026

    This file is part of Structured.

    Structured is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    Structured is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with Structured.  If not, see <http://www.gnu.org/licenses/>.

*/

#ifndef STRUCTURED_CONFIG_HPP__
#define STRUCTURED_CONFIG_HPP__

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Define STRUCTURED_ASSERT_EVERYTHING to 1 to turn on the expensive
// consistency checks (the ones that walk a whole structure).
#ifndef STRUCTURED_ASSERT_EVERYTHING
#define STRUCTURED_ASSERT_EVERYTHING 0
#endif

#if STRUCTURED_ASSERT_EVERYTHING
#define assert_if_ASSERT_EVERYTHING(x) assert(x)
#else
#define assert_if_ASSERT_EVERYTHING(x) ((void)0)
#endif

namespace structured {

// Thrown when the caller of a function has done something wrong that
// the type system couldn't rule out.  Internal bugs use assert instead.
class caller_error : public std::logic_error {
public:
  explicit caller_error(std::string const& what) : std::logic_error(what) {}
};

} // namespace structured

// Usage: caller_error_if(condition, "message describing the mistake");
#define caller_error_if(cond, str) \
  do { \
    if (cond) { \
      LOG << "caller error: " << (str) << '\n'; \
      throw ::structured::caller_error(str); \
    } \
  } while (false)
#define caller_correct_if(cond, str) caller_error_if(!(cond), str)

// Usage: LOG << "something happened: " << x << '\n';
// Output is discarded unless someone called set_debug_print_ostream().
#define LOG (::structured::debug_print_ostream())

#include "utils.hpp"

#endif
