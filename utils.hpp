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

#ifndef STRUCTURED_UTILS_HPP__
#define STRUCTURED_UTILS_HPP__

#include <ostream>

namespace structured {

// The stream behind LOG.  It swallows everything until
// set_debug_print_ostream() points it somewhere; pass nullptr to
// go back to swallowing.
std::ostream& debug_print_ostream();
void set_debug_print_ostream(std::ostream* os);

} // namespace structured

#endif
