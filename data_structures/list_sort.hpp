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

#ifndef STRUCTURED_LIST_SORT_HPP__
#define STRUCTURED_LIST_SORT_HPP__

#include "persistent_list.hpp"

#include <algorithm>
#include <functional>
#include <vector>

namespace structured {

// Quicksort with the head of the list as the pivot.
// The tail is partitioned three ways so that runs of values equal to
// the pivot don't degrade into quadratic behavior.  An already-sorted
// input still recurses once per element.
template<typename T, typename Less = std::less<T>>
persistent_list<T> quicksort(persistent_list<T> const& list, Less less = Less()) {
  if (list.empty()) return list;
  persistent_list<T> const rest = list.tail();
  if (rest.empty()) return list;

  T const& pivot = list.front();
  std::vector<T> lesser;
  std::vector<T> equivalent;
  std::vector<T> greater;
  for (T const& el : rest) {
    if (less(el, pivot)) { lesser.push_back(el); }
    else if (less(pivot, el)) { greater.push_back(el); }
    else { equivalent.push_back(el); }
  }

  persistent_list<T> const middle = persistent_list<T>(equivalent.begin(), equivalent.end()).push_front(pivot);
  persistent_list<T> const sorted_greater = quicksort(persistent_list<T>(greater.begin(), greater.end()), less);
  persistent_list<T> const result = quicksort(persistent_list<T>(lesser.begin(), lesser.end()), less)
    .concatenated(middle.concatenated(sorted_greater));
  assert_if_ASSERT_EVERYTHING(std::is_sorted(result.begin(), result.end(), less));
  return result;
}

namespace list_sort_impl {
// Both inputs must be sorted greatest-first.  The greater of the two
// heads goes onto the front of the accumulator each step (both of
// them, when they're equivalent), so the accumulator comes out
// least-first.
template<typename T, typename Less>
persistent_list<T> merge_descending(persistent_list<T> a, persistent_list<T> b, Less less) {
  persistent_list<T> acc;
  while (!a.empty() || !b.empty()) {
    if (b.empty()) {
      acc = acc.push_front(a.front());
      a = a.tail();
    }
    else if (a.empty()) {
      acc = acc.push_front(b.front());
      b = b.tail();
    }
    else if (less(b.front(), a.front())) {
      acc = acc.push_front(a.front());
      a = a.tail();
    }
    else if (less(a.front(), b.front())) {
      acc = acc.push_front(b.front());
      b = b.tail();
    }
    else {
      acc = acc.push_front(b.front()).push_front(a.front());
      a = a.tail();
      b = b.tail();
    }
  }
  return acc;
}
} // namespace list_sort_impl

// Splits at round(n/2) (the first half gets the extra element when n
// is odd), sorts each half, then merges the two halves back-to-front.
template<typename T, typename Less = std::less<T>>
persistent_list<T> mergesort(persistent_list<T> const& list, Less less = Less()) {
  if (list.empty() || list.tail().empty()) return list;
  const size_t first_size = (list.size() + 1) / 2;
  persistent_list<T> const first = mergesort(list.take(first_size), less);
  persistent_list<T> const second = mergesort(list.drop(first_size), less);
  persistent_list<T> const result = list_sort_impl::merge_descending(first.reversed(), second.reversed(), less);
  assert_if_ASSERT_EVERYTHING(std::is_sorted(result.begin(), result.end(), less));
  return result;
}

} // namespace structured

#endif
