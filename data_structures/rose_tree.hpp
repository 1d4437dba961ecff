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

#ifndef STRUCTURED_ROSE_TREE_HPP__
#define STRUCTURED_ROSE_TREE_HPP__

// A rose tree: every node has an optional value, any number of
// ordered children and a little map of metadata.
//
// Trees are values.  Nothing here edits a tree in place; insert_child()
// and friends hand back a new tree and the old one stays as it was.
// Children are owned by their parent and there are no parent
// pointers, so you can only walk downwards.
//
// nested<Value> is the bracket-list shape that trees are built from
// and flattened back into:
//   from_nested({1, {2, 3, {4, 5}, 6}, 7})
// is a 1 with two children, a 2 (with children 3, 4 and 6, where 4
// has a child 5) and a 7.  boost::blank stands for "no value".

#include "../config.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <numeric>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>
#include <boost/blank.hpp>
#include <boost/iterator/iterator_facade.hpp>
#include <boost/optional.hpp>
#include <boost/utility/enable_if.hpp>
#include <boost/variant.hpp>

namespace structured {

typedef boost::variant<boost::blank, bool, int64_t, double, std::string> meta_value;
typedef std::map<std::string, meta_value> meta_map;

template<typename Value>
struct nested_of {
  typedef typename boost::make_recursive_variant<
    boost::blank, Value, std::vector<boost::recursive_variant_>
  >::type type;
};
template<typename Value>
using nested = typename nested_of<Value>::type;

template<typename Value>
class rose_tree {
public:
  typedef Value scalar_type;
  typedef nested<Value> nested_type;
  typedef std::vector<nested_type> sequence;
  typedef std::vector<rose_tree> children_type;

  // Walks the fully flattened values (see count()) in order.
  // Each begin() starts over from the root; an iterator keeps its
  // own stack of where it has been and shares nothing with the tree
  // except read access.
  class const_iterator : public boost::iterator_facade<const_iterator, boost::optional<Value> const, boost::forward_traversal_tag> {
  public:
    const_iterator():current_(nullptr){}
  private:
    friend class boost::iterator_core_access;
    friend class rose_tree;

    struct frame {
      frame(rose_tree const* node, bool is_root):node(node),next_child(0),entered(false),is_root(is_root){}
      rose_tree const* node;
      size_t next_child;
      bool entered;
      bool is_root;
    };

    explicit const_iterator(rose_tree const* root):current_(nullptr) {
      stack_.push_back(frame(root, true));
      advance();
    }

    void increment() {
      assert(current_);
      advance();
    }
    bool equal(const_iterator const& other)const { return current_ == other.current_; }
    boost::optional<Value> const& dereference()const { return current_->value_; }

    // A node's own slot shows up if it has a value.  A valueless leaf
    // still shows up (as an absent entry) unless it is the root, since
    // the empty tree flattens to nothing at all.
    static bool contributes_own_slot(frame const& f) {
      return f.node->value_ || (f.node->children_.empty() && !f.is_root);
    }
    void advance() {
      while (!stack_.empty()) {
        frame& f = stack_.back();
        if (!f.entered) {
          f.entered = true;
          if (contributes_own_slot(f)) {
            current_ = f.node;
            return;
          }
        }
        if (f.next_child < f.node->children_.size()) {
          rose_tree const* child = &f.node->children_[f.next_child];
          ++f.next_child;
          stack_.push_back(frame(child, false));
        }
        else {
          stack_.pop_back();
        }
      }
      current_ = nullptr;
    }

    std::vector<frame> stack_;
    rose_tree const* current_;
  };
  typedef const_iterator iterator;

  // The empty tree: no value, no children.
  rose_tree() {}
  explicit rose_tree(Value const& value):value_(value){}
  rose_tree(boost::optional<Value> value, children_type children, meta_map meta = meta_map()):
    value_(std::move(value)),children_(std::move(children)),meta_(std::move(meta)){}

  // A scalar becomes a leaf.  A sequence becomes a tree whose value is
  // the first element and whose children are the rest, each built by
  // from_nested() in turn; the empty sequence is the empty tree.
  static rose_tree from_nested(nested_type const& input) {
    return boost::apply_visitor(from_nested_visitor(), input);
  }

  boost::optional<Value> const& value()const { return value_; }
  children_type const& children()const { return children_; }
  meta_map const& meta()const { return meta_; }

  bool is_empty()const { return !value_ && children_.empty(); }
  bool is_leaf()const { return children_.empty(); }

  // Depth-first, children in order, stopping at the first match.
  bool contains(Value const& target)const {
    std::vector<rose_tree const*> pending(1, this);
    while (!pending.empty()) {
      rose_tree const* t = pending.back();
      pending.pop_back();
      if (t->value_ && *t->value_ == target) return true;
      for (typename children_type::const_reverse_iterator i = t->children_.rbegin(); i != t->children_.rend(); ++i) {
        pending.push_back(&*i);
      }
    }
    return false;
  }

  // The length of values() with every level of nesting removed.
  size_t count()const {
    return static_cast<size_t>(std::distance(begin(), end()));
  }

  // Left fold over the same values count() counts.  combine is called
  // as combine(acc, boost::optional<Value> const&).
  template<typename Accumulator, typename Combine>
  Accumulator reduce(Accumulator initial, Combine combine)const {
    return std::accumulate(begin(), end(), initial, combine);
  }

  const_iterator begin()const { return const_iterator(this); }
  const_iterator end()const { return const_iterator(); }

  // The tree as a nested sequence: [value, child, child, ...].  A leaf
  // child is written as its bare value, any other child as a nested
  // sequence of its own.  A valueless node just leaves its value out.
  // from_nested(t.values()) rebuilds t (metadata aside).
  sequence values()const {
    if (children_.empty()) {
      if (!value_) return sequence();
      return sequence(1, nested_type(*value_));
    }
    return internal_sequence();
  }

  // Every descendant with no children, left to right.  A tree with no
  // children is its own only leaf.
  children_type leaves()const {
    children_type result;
    std::vector<rose_tree const*> pending(1, this);
    while (!pending.empty()) {
      rose_tree const* t = pending.back();
      pending.pop_back();
      if (t->children_.empty()) {
        result.push_back(*t);
        continue;
      }
      for (typename children_type::const_reverse_iterator i = t->children_.rbegin(); i != t->children_.rend(); ++i) {
        pending.push_back(&*i);
      }
    }
    return result;
  }
  std::vector<boost::optional<Value>> leaf_values()const {
    std::vector<boost::optional<Value>> result;
    for (rose_tree const& leaf : leaves()) {
      result.push_back(leaf.value_);
    }
    return result;
  }

  rose_tree insert_child(rose_tree const& child)const {
    rose_tree result = *this;
    result.children_.push_back(child);
    return result;
  }
  rose_tree insert_child(Value const& child)const {
    return insert_child(rose_tree(child));
  }

  // Removes the first child that is equal to `child` in every respect
  // (value, children and metadata).  No match, no change.
  rose_tree remove_child_by_identity(rose_tree const& child)const {
    const typename children_type::const_iterator i = std::find(children_.begin(), children_.end(), child);
    if (i == children_.end()) return *this;
    return without_child_at(i - children_.begin());
  }
  // Removes the first direct child whose value is `child`.  Grandchildren
  // aren't looked at.
  rose_tree remove_child_by_value(Value const& child)const {
    for (size_t idx = 0; idx < children_.size(); ++idx) {
      if (children_[idx].value_ && *children_[idx].value_ == child) {
        return without_child_at(idx);
      }
    }
    return *this;
  }

  rose_tree with_value(boost::optional<Value> value)const {
    rose_tree result = *this;
    result.value_ = std::move(value);
    return result;
  }
  rose_tree with_meta(std::string const& key, meta_value const& v)const {
    rose_tree result = *this;
    result.meta_[key] = v;
    return result;
  }
  // Otherwise a string literal would quietly become a bool.
  rose_tree with_meta(std::string const& key, char const* v)const {
    return with_meta(key, meta_value(std::string(v)));
  }
  // Any integer but bool is stored as int64_t; a plain int would be
  // ambiguous between bool, int64_t and double.
  template<typename Int>
  typename boost::enable_if_c<std::is_integral<Int>::value && !std::is_same<Int, bool>::value, rose_tree>::type
  with_meta(std::string const& key, Int v)const {
    return with_meta(key, meta_value(static_cast<int64_t>(v)));
  }
  rose_tree without_meta(std::string const& key)const {
    rose_tree result = *this;
    result.meta_.erase(key);
    return result;
  }

  friend inline bool operator==(rose_tree const& a, rose_tree const& b) {
    return a.value_ == b.value_ && a.meta_ == b.meta_ && a.children_ == b.children_;
  }
  friend inline bool operator!=(rose_tree const& a, rose_tree const& b) { return !(a == b); }

  friend inline std::ostream& operator<<(std::ostream& os, rose_tree const& t) {
    os << "tree{";
    if (t.value_) { os << *t.value_; }
    else { os << '_'; }
    if (!t.children_.empty()) {
      os << " [";
      for (size_t i = 0; i < t.children_.size(); ++i) {
        if (i) { os << ", "; }
        os << t.children_[i];
      }
      os << ']';
    }
    if (!t.meta_.empty()) {
      os << " {";
      for (typename meta_map::const_iterator i = t.meta_.begin(); i != t.meta_.end(); ++i) {
        if (i != t.meta_.begin()) { os << ", "; }
        os << i->first << ": " << i->second;
      }
      os << '}';
    }
    os << '}';
    return os;
  }

private:
  struct from_nested_visitor : public boost::static_visitor<rose_tree> {
    rose_tree operator()(boost::blank)const {
      return rose_tree();
    }
    rose_tree operator()(Value const& v)const {
      return rose_tree(v);
    }
    rose_tree operator()(sequence const& s)const {
      rose_tree result;
      if (s.empty()) return result;
      caller_error_if(boost::get<sequence>(&s.front()), "a nested sequence can't be the value of a tree");
      if (Value const* v = boost::get<Value>(&s.front())) {
        result.value_ = *v;
      }
      result.children_.reserve(s.size() - 1);
      for (typename sequence::const_iterator i = s.begin() + 1; i != s.end(); ++i) {
        result.children_.push_back(from_nested(*i));
      }
      return result;
    }
  };

  // Only called on trees with children.
  sequence internal_sequence()const {
    assert(!children_.empty());
    sequence result;
    result.reserve(children_.size() + 1);
    if (value_) { result.push_back(nested_type(*value_)); }
    for (rose_tree const& child : children_) {
      result.push_back(child.internal_values());
    }
    return result;
  }
  nested_type internal_values()const {
    if (children_.empty()) {
      if (value_) return nested_type(*value_);
      return nested_type();
    }
    return nested_type(internal_sequence());
  }

  rose_tree without_child_at(size_t idx)const {
    assert(idx < children_.size());
    rose_tree result = *this;
    result.children_.erase(result.children_.begin() + idx);
    return result;
  }

  boost::optional<Value> value_;
  children_type children_;
  meta_map meta_;
};

} // namespace structured

#endif
