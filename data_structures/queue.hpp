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

#ifndef STRUCTURED_QUEUE_HPP__
#define STRUCTURED_QUEUE_HPP__

// First-in first-out functions on a persistent_list.
//
// The front of the list is the next item out, which makes peek() and
// dequeue() O(1).  enqueue() has to copy every cell to put the new
// item at the far end, so it's O(n).  That's the price of a singly-
// linked representation; callers who enqueue a lot should batch.

#include "persistent_list.hpp"

#include <utility>
#include <boost/optional.hpp>

namespace structured {

// Returns the next item out and the queue, unaltered.
template<typename T>
std::pair<boost::optional<T>, persistent_list<T>> peek(persistent_list<T> const& queue) {
  if (queue.empty()) return std::make_pair(boost::optional<T>(), queue);
  return std::make_pair(boost::optional<T>(queue.front()), queue);
}
template<typename T>
std::pair<T, persistent_list<T>> peek(persistent_list<T> const& queue, T const& default_value) {
  return std::make_pair(queue.empty() ? default_value : queue.front(), queue);
}

// Returns the next item out and the queue without it.
template<typename T>
std::pair<boost::optional<T>, persistent_list<T>> dequeue(persistent_list<T> const& queue) {
  if (queue.empty()) return std::make_pair(boost::optional<T>(), queue);
  return std::make_pair(boost::optional<T>(queue.front()), queue.tail());
}
template<typename T>
std::pair<T, persistent_list<T>> dequeue(persistent_list<T> const& queue, T const& default_value) {
  if (queue.empty()) return std::make_pair(default_value, queue);
  return std::make_pair(queue.front(), queue.tail());
}

template<typename T>
persistent_list<T> enqueue(persistent_list<T> const& queue, T const& value) {
  return queue.push_back(value);
}

} // namespace structured

#endif
