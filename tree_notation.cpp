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

#include "tree_notation.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace structured {

notation_error::notation_error(std::string const& what, size_t offset):
  std::runtime_error(what + " at offset " + std::to_string(offset)),offset_(offset){}

namespace {

class parser {
public:
  explicit parser(std::string const& text):text_(text),pos_(0){}

  int_nested parse_all() {
    int_nested result = parse_element(0);
    skip_whitespace();
    if (pos_ != text_.size()) { fail("trailing characters"); }
    return result;
  }

private:
  int_nested parse_element(size_t depth) {
    skip_whitespace();
    if (pos_ == text_.size()) { fail("unexpected end of input"); }
    const char c = text_[pos_];
    if (c == '[') { return parse_sequence(depth + 1); }
    if (c == '_') {
      ++pos_;
      return int_nested();
    }
    if (c == '-' || c == '+' || std::isdigit(static_cast<unsigned char>(c))) {
      return int_nested(parse_integer());
    }
    fail(std::string("unexpected character '") + c + "'");
    return int_nested();
  }

  int_nested parse_sequence(size_t depth) {
    assert(text_[pos_] == '[');
    if (depth > max_notation_depth) { fail("nesting too deep"); }
    ++pos_;
    int_tree::sequence result;
    skip_whitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return int_nested(result);
    }
    while (true) {
      result.push_back(parse_element(depth));
      skip_whitespace();
      if (pos_ == text_.size()) { fail("unterminated sequence"); }
      if (text_[pos_] == ']') {
        ++pos_;
        return int_nested(result);
      }
      if (text_[pos_] != ',') { fail("expected ',' or ']'"); }
      ++pos_;
    }
  }

  int64_t parse_integer() {
    const size_t start = pos_;
    bool negative = false;
    if (text_[pos_] == '-' || text_[pos_] == '+') {
      negative = (text_[pos_] == '-');
      ++pos_;
    }
    if (pos_ == text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      fail("expected a digit");
    }
    // Accumulate as a negative number so that the minimum int64_t fits.
    int64_t result = 0;
    const int64_t min = std::numeric_limits<int64_t>::min();
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
      const int digit = text_[pos_] - '0';
      if (result < (min + digit) / 10) {
        pos_ = start;
        fail("integer out of range");
      }
      result = result * 10 - digit;
      ++pos_;
    }
    if (!negative) {
      if (result == min) {
        pos_ = start;
        fail("integer out of range");
      }
      result = -result;
    }
    return result;
  }

  void skip_whitespace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) { ++pos_; }
  }

  void fail(std::string const& what)const {
    throw notation_error(what, pos_);
  }

  std::string const& text_;
  size_t pos_;
};

class formatter : public boost::static_visitor<void> {
public:
  explicit formatter(std::ostream& os):os_(os){}
  void operator()(boost::blank)const { os_ << '_'; }
  void operator()(int64_t v)const { os_ << v; }
  void operator()(int_tree::sequence const& s)const {
    os_ << '[';
    for (size_t i = 0; i < s.size(); ++i) {
      if (i) { os_ << ", "; }
      boost::apply_visitor(*this, s[i]);
    }
    os_ << ']';
  }
private:
  std::ostream& os_;
};

} // unnamed namespace

int_nested parse_nested(std::string const& text) {
  return parser(text).parse_all();
}

std::string format_nested(int_nested const& n) {
  std::ostringstream os;
  boost::apply_visitor(formatter(os), n);
  return os.str();
}

std::string format_sequence(int_tree::sequence const& s) {
  return format_nested(int_nested(s));
}

} // namespace structured
