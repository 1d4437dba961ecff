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

#include "utils.hpp"

#include <streambuf>

namespace structured {

namespace {
class null_streambuf : public std::streambuf {
protected:
  int_type overflow(int_type c) override { return traits_type::not_eof(c); }
  std::streamsize xsputn(char const*, std::streamsize n) override { return n; }
};

null_streambuf null_buf;
std::ostream null_ostream(&null_buf);
std::ostream* current_debug_print_ostream = &null_ostream;
}

std::ostream& debug_print_ostream() {
  return *current_debug_print_ostream;
}

void set_debug_print_ostream(std::ostream* os) {
  current_debug_print_ostream = os ? os : &null_ostream;
}

} // namespace structured
