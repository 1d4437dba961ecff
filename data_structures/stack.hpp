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

#ifndef STRUCTURED_STACK_HPP__
#define STRUCTURED_STACK_HPP__

// Last-in first-out functions on a persistent_list.  The front of the
// list is the top of the stack, so top(), pop() and push() are all O(1).

#include "persistent_list.hpp"

#include <utility>
#include <boost/optional.hpp>

namespace structured {

template<typename T>
boost::optional<T> top(persistent_list<T> const& stack) {
  if (stack.empty()) return boost::none;
  return stack.front();
}
template<typename T>
T top(persistent_list<T> const& stack, T const& default_value) {
  if (stack.empty()) return default_value;
  return stack.front();
}

// Returns the top and the stack without it.
template<typename T>
std::pair<boost::optional<T>, persistent_list<T>> pop(persistent_list<T> const& stack) {
  if (stack.empty()) return std::make_pair(boost::optional<T>(), stack);
  return std::make_pair(boost::optional<T>(stack.front()), stack.tail());
}
template<typename T>
std::pair<T, persistent_list<T>> pop(persistent_list<T> const& stack, T const& default_value) {
  if (stack.empty()) return std::make_pair(default_value, stack);
  return std::make_pair(stack.front(), stack.tail());
}

template<typename T>
persistent_list<T> push(persistent_list<T> const& stack, T const& value) {
  return stack.push_front(value);
}

} // namespace structured

#endif
