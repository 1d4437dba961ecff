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

#define TESTS_FILE binary_search_tests
#include "test_header.hpp"

#include "../data_structures/binary_search.hpp"

#include <array>
#include <sstream>
#include <vector>

BEGIN_TESTS

using namespace structured;

BOOST_AUTO_TEST_CASE(binary_search_examples) {
  std::array<int, 0> const none = {{}};
  std::array<int, 1> const one = {{1}};
  std::array<int, 6> const six = {{1, 2, 3, 4, 5, 6}};
  std::array<int, 7> const seven = {{1, 2, 3, 4, 5, 6, 7}};
  BOOST_CHECK_EQUAL(binary_search(none, 1), -1);
  BOOST_CHECK_EQUAL(binary_search(one, 1), 0);
  BOOST_CHECK_EQUAL(binary_search(six, 3), 2);
  BOOST_CHECK_EQUAL(binary_search(seven, 7), 6);
  BOOST_CHECK_EQUAL(binary_search(one, 2), -1);
  BOOST_CHECK_EQUAL(binary_search(seven, 0), -1);
  BOOST_CHECK_EQUAL(binary_search(seven, 8), -1);

  int const c_array[] = {1, 2, 3, 4, 5, 6};
  BOOST_CHECK_EQUAL(binary_search(c_array, 6), 5);
  BOOST_CHECK_EQUAL(binary_search(c_array, 4), 3);
}

BOOST_AUTO_TEST_CASE(binary_search_follows_its_probe_sequence) {
  std::vector<int> const five = {1, 2, 3, 4, 5};
  // probes 2, then 4 == n-1, and stops without ever looking at index 3
  BOOST_CHECK_EQUAL(binary_search(five, 4), -1);
  BOOST_CHECK_EQUAL(binary_search(five, 3), 2);
  // probes 2, then 1, then 0
  BOOST_CHECK_EQUAL(binary_search(five, 1), 0);
  BOOST_CHECK_EQUAL(binary_search(five, 2), 1);
}

BOOST_AUTO_TEST_CASE(binary_search_terminates_on_probe_cycles) {
  std::vector<int> const tens = {10, 20, 30, 40, 50, 60, 70, 80};
  std::ostringstream log;
  set_debug_print_ostream(&log);
  // probes 4, 6, 3, 6, ...
  BOOST_CHECK_EQUAL(binary_search(tens, 55), -1);
  BOOST_CHECK_EQUAL(binary_search(tens, 60), -1);
  set_debug_print_ostream(nullptr);
  BOOST_CHECK(!log.str().empty());

  BOOST_CHECK_EQUAL(binary_search(tens, 50), 4);
  BOOST_CHECK_EQUAL(binary_search(tens, 70), 6);
  BOOST_CHECK_EQUAL(binary_search(tens, 30), 2);
  BOOST_CHECK_EQUAL(binary_search(tens, 80), 7);
}

BOOST_AUTO_TEST_CASE(binary_search_never_returns_a_wrong_index) {
  for (int n = 0; n < 40; ++n) {
    std::vector<int> v;
    for (int i = 0; i < n; ++i) { v.push_back(i * 2); }
    for (int target = -1; target <= n * 2; ++target) {
      const std::ptrdiff_t idx = binary_search(v, target);
      if (idx != not_found) {
        BOOST_REQUIRE(idx >= 0 && idx < n);
        BOOST_CHECK_EQUAL(v[idx], target);
      }
      if (target % 2) {
        BOOST_CHECK_EQUAL(idx, not_found);
      }
    }
  }
}

REGISTER_TESTS // This must come last in the file.
