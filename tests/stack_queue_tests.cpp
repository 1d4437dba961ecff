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

#define TESTS_FILE stack_queue_tests
#include "test_header.hpp"

#include "../data_structures/queue.hpp"
#include "../data_structures/stack.hpp"

#include <string>
#include <utility>

BEGIN_TESTS

using namespace structured;

typedef persistent_list<int> int_list;

BOOST_AUTO_TEST_CASE(stack_examples) {
  BOOST_CHECK_EQUAL(push(int_list{5, 4, 3, 2, 1}, 6), (int_list{6, 5, 4, 3, 2, 1}));
  BOOST_CHECK_EQUAL(push(int_list(), 1), int_list{1});

  BOOST_CHECK(top(int_list{6, 5, 4, 3, 2, 1}) == boost::optional<int>(6));
  BOOST_CHECK(!top(int_list()));
  BOOST_CHECK_EQUAL(top(int_list(), -1), -1);
  BOOST_CHECK_EQUAL(top(int_list{3}, -1), 3);

  std::pair<boost::optional<int>, int_list> const popped = pop(int_list{6, 5, 4, 3, 2, 1});
  BOOST_CHECK(popped.first == boost::optional<int>(6));
  BOOST_CHECK_EQUAL(popped.second, (int_list{5, 4, 3, 2, 1}));

  std::pair<boost::optional<int>, int_list> const last = pop(int_list{1});
  BOOST_CHECK(last.first == boost::optional<int>(1));
  BOOST_CHECK(last.second.empty());

  std::pair<boost::optional<int>, int_list> const nothing = pop(int_list());
  BOOST_CHECK(!nothing.first);
  BOOST_CHECK(nothing.second.empty());

  persistent_list<std::string> const no_strings;
  std::pair<std::string, persistent_list<std::string>> const defaulted = pop(no_strings, std::string("empty"));
  BOOST_CHECK_EQUAL(defaulted.first, "empty");
  BOOST_CHECK(defaulted.second.empty());
}

BOOST_AUTO_TEST_CASE(stack_is_last_in_first_out) {
  int_list s{3, 2, 1};
  for (int x = 0; x < 10; ++x) {
    std::pair<int, int_list> const r = pop(push(s, x), -1);
    BOOST_CHECK_EQUAL(r.first, x);
    BOOST_CHECK_EQUAL(r.second, s);
    s = push(s, x);
  }
  for (int x = 9; x >= 0; --x) {
    std::pair<int, int_list> const r = pop(s, -1);
    BOOST_CHECK_EQUAL(r.first, x);
    s = r.second;
  }
  BOOST_CHECK_EQUAL(s, (int_list{3, 2, 1}));
}

BOOST_AUTO_TEST_CASE(queue_examples) {
  std::pair<boost::optional<int>, int_list> const peeked = peek(int_list{1, 2, 3, 4});
  BOOST_CHECK(peeked.first == boost::optional<int>(1));
  BOOST_CHECK_EQUAL(peeked.second, (int_list{1, 2, 3, 4}));

  std::pair<boost::optional<int>, int_list> const dequeued = dequeue(int_list{1, 2, 3, 4});
  BOOST_CHECK(dequeued.first == boost::optional<int>(1));
  BOOST_CHECK_EQUAL(dequeued.second, (int_list{2, 3, 4}));

  BOOST_CHECK_EQUAL(enqueue(int_list{1, 2, 3}, 4), (int_list{1, 2, 3, 4}));
  BOOST_CHECK_EQUAL(enqueue(int_list(), 1), int_list{1});

  BOOST_CHECK(!peek(int_list()).first);
  BOOST_CHECK(peek(int_list()).second.empty());
  BOOST_CHECK(!dequeue(int_list()).first);
  BOOST_CHECK(dequeue(int_list()).second.empty());
  BOOST_CHECK_EQUAL(peek(int_list(), 0).first, 0);
  BOOST_CHECK_EQUAL(dequeue(int_list(), 0).first, 0);
  BOOST_CHECK_EQUAL(dequeue(int_list{8}, 0).first, 8);
}

BOOST_AUTO_TEST_CASE(queue_is_first_in_first_out) {
  int_list q;
  for (int x = 0; x < 20; ++x) {
    q = enqueue(q, x);
  }
  for (int x = 0; x < 20; ++x) {
    std::pair<boost::optional<int>, int_list> const r = dequeue(q);
    BOOST_REQUIRE(r.first);
    BOOST_CHECK_EQUAL(*r.first, x);
    q = r.second;
  }
  BOOST_CHECK(q.empty());
}

REGISTER_TESTS // This must come last in the file.
