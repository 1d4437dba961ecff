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

#define TESTS_FILE list_sort_tests
#include "test_header.hpp"

#include "../data_structures/list_sort.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <vector>

BEGIN_TESTS

using namespace structured;

typedef persistent_list<int> int_list;

BOOST_AUTO_TEST_CASE(quicksort_examples) {
  BOOST_CHECK_EQUAL(quicksort(int_list()), int_list());
  BOOST_CHECK_EQUAL(quicksort(int_list{7}), int_list{7});
  BOOST_CHECK_EQUAL(quicksort(int_list{3, 1, 2}), (int_list{1, 2, 3}));
  BOOST_CHECK_EQUAL(quicksort(int_list{9, -9, 9, -9, 9, -9, 9, 9, 9}),
                    (int_list{-9, -9, -9, 9, 9, 9, 9, 9, 9}));
}

BOOST_AUTO_TEST_CASE(mergesort_examples) {
  BOOST_CHECK_EQUAL(mergesort(int_list()), int_list());
  BOOST_CHECK_EQUAL(mergesort(int_list{7}), int_list{7});
  BOOST_CHECK_EQUAL(mergesort(int_list{3, 1, 2}), (int_list{1, 2, 3}));
  BOOST_CHECK_EQUAL(mergesort(int_list{9, -9, -9, 9, 9, -9}), (int_list{-9, -9, -9, 9, 9, 9}));
  BOOST_CHECK_EQUAL(mergesort(int_list{5, 4, 3, 2, 1}), (int_list{1, 2, 3, 4, 5}));
}

BOOST_AUTO_TEST_CASE(sorts_with_custom_ordering) {
  BOOST_CHECK_EQUAL(quicksort(int_list{3, 1, 2}, std::greater<int>()), (int_list{3, 2, 1}));
  BOOST_CHECK_EQUAL(mergesort(int_list{3, 1, 2, 2}, std::greater<int>()), (int_list{3, 2, 2, 1}));
}

BOOST_AUTO_TEST_CASE(sorts_agree_with_std_sort) {
  srand(12345);
  for (int size = 0; size < 60; ++size) {
    std::vector<int> v;
    for (int i = 0; i < size; ++i) {
      v.push_back(rand() % 10 - 5);
    }
    int_list const input(v.begin(), v.end());
    std::sort(v.begin(), v.end());
    int_list const expected(v.begin(), v.end());
    BOOST_CHECK_EQUAL(quicksort(input), expected);
    BOOST_CHECK_EQUAL(mergesort(input), expected);
    // the input is a value; sorting it doesn't change it
    BOOST_CHECK_EQUAL(input.size(), static_cast<size_t>(size));
  }
}

REGISTER_TESTS // This must come last in the file.
