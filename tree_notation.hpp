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

#ifndef STRUCTURED_TREE_NOTATION_HPP__
#define STRUCTURED_TREE_NOTATION_HPP__

// Reading and writing nested integer sequences as bracket text, e.g.
//   [1, [2, 3, [4, 5], 6], 7]
// Whitespace between tokens is ignored.  `_` is the absent value.

#include "config.hpp"
#include "data_structures/rose_tree.hpp"

#include <stdexcept>
#include <string>

namespace structured {

typedef nested<int64_t> int_nested;
typedef rose_tree<int64_t> int_tree;

class notation_error : public std::runtime_error {
public:
  notation_error(std::string const& what, size_t offset);
  // Byte offset into the text where parsing stopped.
  size_t offset()const { return offset_; }
private:
  size_t offset_;
};

// Deepest bracket nesting parse_nested accepts.  The parser and the
// variant it builds both recurse per level.
static const size_t max_notation_depth = 1000;

// Throws notation_error if `text` isn't exactly one scalar or
// bracketed sequence.
int_nested parse_nested(std::string const& text);

std::string format_nested(int_nested const& n);
std::string format_sequence(int_tree::sequence const& s);

} // namespace structured

#endif
