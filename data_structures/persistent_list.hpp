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

#ifndef STRUCTURED_PERSISTENT_LIST_HPP__
#define STRUCTURED_PERSISTENT_LIST_HPP__

// An immutable singly-linked list made of shared cons cells.
//
// Every "modifying" operation returns a new list and leaves the old
// one alone.  Lists share structure, so push_front(), tail() and
// front() are O(1); anything that has to touch the far end of the
// list (push_back(), reversed(), concatenated(), size()) is O(n).

#include "../config.hpp"

#include <initializer_list>
#include <iterator>
#include <memory>
#include <ostream>
#include <vector>
#include <boost/iterator/iterator_facade.hpp>

namespace structured {

template<typename T>
class persistent_list {
private:
  struct cell {
    cell(T const& head, std::shared_ptr<cell const> tail):head(head),tail(std::move(tail)){}
    T head;
    std::shared_ptr<cell const> tail;
  };
  typedef std::shared_ptr<cell const> cell_ptr;

public:
  typedef T value_type;
  typedef size_t size_type;

  class const_iterator : public boost::iterator_facade<const_iterator, T const, boost::forward_traversal_tag> {
  public:
    const_iterator():c_(nullptr){}
  private:
    explicit const_iterator(cell const* c):c_(c){}
    friend class boost::iterator_core_access;
    friend class persistent_list;

    void increment() { c_ = c_->tail.get(); }
    bool equal(const_iterator const& other)const { return c_ == other.c_; }
    T const& dereference()const { return c_->head; }

    cell const* c_;
  };
  typedef const_iterator iterator;

  persistent_list() {}
  persistent_list(std::initializer_list<T> init) : head_(build(init.begin(), init.end(), cell_ptr())) {}
  template<typename InputIterator>
  persistent_list(InputIterator first, InputIterator last) {
    std::vector<T> elements(first, last);
    head_ = build(elements.begin(), elements.end(), cell_ptr());
  }
  persistent_list(persistent_list const& other) = default;
  persistent_list(persistent_list&& other) : head_(std::move(other.head_)) {}
  persistent_list& operator=(persistent_list other) {
    head_.swap(other.head_);
    return *this;
  }
  // Unlink one cell at a time so that dropping a long list can't
  // blow the call stack.
  ~persistent_list() {
    while (head_ && head_.use_count() == 1) {
      cell_ptr next = head_->tail;
      head_.reset();
      head_ = std::move(next);
    }
  }

  bool empty()const { return !head_; }
  size_type size()const {
    size_type result = 0;
    for (cell const* c = head_.get(); c; c = c->tail.get()) { ++result; }
    return result;
  }

  T const& front()const {
    caller_correct_if(head_, "front() of an empty persistent_list");
    return head_->head;
  }
  persistent_list tail()const {
    caller_correct_if(head_, "tail() of an empty persistent_list");
    return persistent_list(head_->tail);
  }
  persistent_list push_front(T const& v)const {
    return persistent_list(std::make_shared<cell>(v, head_));
  }

  persistent_list push_back(T const& v)const {
    return concatenated(persistent_list().push_front(v));
  }
  // Copies this list's cells; the result shares all of `other`.
  persistent_list concatenated(persistent_list const& other)const {
    std::vector<T const*> elements;
    for (cell const* c = head_.get(); c; c = c->tail.get()) { elements.push_back(&c->head); }
    cell_ptr result = other.head_;
    for (typename std::vector<T const*>::const_reverse_iterator i = elements.rbegin(); i != elements.rend(); ++i) {
      result = std::make_shared<cell>(**i, std::move(result));
    }
    return persistent_list(std::move(result));
  }
  // The first n elements (all of them, if there are fewer than n).
  persistent_list take(size_type n)const {
    std::vector<T const*> elements;
    for (cell const* c = head_.get(); c && elements.size() < n; c = c->tail.get()) { elements.push_back(&c->head); }
    cell_ptr result;
    for (typename std::vector<T const*>::const_reverse_iterator i = elements.rbegin(); i != elements.rend(); ++i) {
      result = std::make_shared<cell>(**i, std::move(result));
    }
    return persistent_list(std::move(result));
  }
  // Everything after the first n elements.  Shares cells with *this.
  persistent_list drop(size_type n)const {
    cell_ptr result = head_;
    while (result && n) {
      result = result->tail;
      --n;
    }
    return persistent_list(std::move(result));
  }
  persistent_list reversed()const {
    persistent_list result;
    for (cell const* c = head_.get(); c; c = c->tail.get()) {
      result = result.push_front(c->head);
    }
    return result;
  }

  const_iterator begin()const { return const_iterator(head_.get()); }
  const_iterator end()const { return const_iterator(); }

  friend inline bool operator==(persistent_list const& a, persistent_list const& b) {
    cell const* ca = a.head_.get();
    cell const* cb = b.head_.get();
    while (ca && cb) {
      if (ca == cb) return true;
      if (!(ca->head == cb->head)) return false;
      ca = ca->tail.get();
      cb = cb->tail.get();
    }
    return ca == cb;
  }
  friend inline bool operator!=(persistent_list const& a, persistent_list const& b) { return !(a == b); }

  friend inline std::ostream& operator<<(std::ostream& os, persistent_list const& l) {
    os << '[';
    bool first = true;
    for (T const& v : l) {
      if (!first) { os << ", "; }
      os << v;
      first = false;
    }
    os << ']';
    return os;
  }

private:
  explicit persistent_list(cell_ptr head):head_(std::move(head)){}

  template<typename RandomAccessIterator>
  static cell_ptr build(RandomAccessIterator first, RandomAccessIterator last, cell_ptr tail) {
    while (last != first) {
      --last;
      tail = std::make_shared<cell>(*last, std::move(tail));
    }
    return tail;
  }

  cell_ptr head_;
};

} // namespace structured

#endif
