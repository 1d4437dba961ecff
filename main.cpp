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

#include "config.hpp"
#include "tree_notation.hpp"
#include "data_structures/binary_search.hpp"
#include "data_structures/list_sort.hpp"
#include "data_structures/persistent_list.hpp"
#include "data_structures/queue.hpp"
#include "data_structures/rose_tree.hpp"
#include "data_structures/stack.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;
using namespace structured;

namespace {

typedef persistent_list<int64_t> int_list;

std::vector<int64_t> to_integers(std::vector<std::string> const& args, size_t skip) {
  std::vector<int64_t> result;
  for (size_t i = skip; i < args.size(); ++i) {
    try {
      result.push_back(boost::lexical_cast<int64_t>(args[i]));
    }
    catch (boost::bad_lexical_cast const&) {
      throw po::error("'" + args[i] + "' is not an integer");
    }
  }
  return result;
}

int_list to_list(std::vector<std::string> const& args, size_t skip) {
  std::vector<int64_t> const integers = to_integers(args, skip);
  return int_list(integers.begin(), integers.end());
}

int64_t first_integer(std::vector<std::string> const& args, std::string const& command) {
  if (args.empty()) { throw po::error(command + " needs a value before the list"); }
  return to_integers(args, 0).front();
}

std::ostream& operator<<(std::ostream& os, boost::optional<int64_t> const& v) {
  if (v) { return os << *v; }
  return os << '_';
}

void print_tree(int_tree const& tree) {
  std::cout << "values: " << format_sequence(tree.values()) << '\n';
  std::cout << "leaves:";
  for (boost::optional<int64_t> const& v : tree.leaf_values()) {
    std::cout << ' ' << v;
  }
  std::cout << '\n';
  std::cout << "count: " << tree.count() << '\n';
  std::cout << "leaf: " << (tree.is_leaf() ? "yes" : "no")
            << ", empty: " << (tree.is_empty() ? "yes" : "no") << '\n';
}

int run(std::string const& command, std::vector<std::string> const& args, po::variables_map const& vm) {
  const bool has_default = vm.count("default") != 0;
  const int64_t default_value = has_default ? vm["default"].as<int64_t>() : 0;

  if (command == "quicksort") {
    std::cout << quicksort(to_list(args, 0)) << '\n';
  }
  else if (command == "mergesort") {
    std::cout << mergesort(to_list(args, 0)) << '\n';
  }
  else if (command == "search") {
    const int64_t target = first_integer(args, command);
    std::vector<int64_t> const sorted = to_integers(args, 1);
    std::cout << binary_search(sorted, target) << '\n';
  }
  else if (command == "push") {
    std::cout << push(to_list(args, 1), first_integer(args, command)) << '\n';
  }
  else if (command == "enqueue") {
    std::cout << enqueue(to_list(args, 1), first_integer(args, command)) << '\n';
  }
  else if (command == "top") {
    int_list const stack = to_list(args, 0);
    if (has_default) { std::cout << top(stack, default_value) << '\n'; }
    else { std::cout << top(stack) << '\n'; }
  }
  else if (command == "pop" || command == "dequeue" || command == "peek") {
    int_list const l = to_list(args, 0);
    if (has_default) {
      std::pair<int64_t, int_list> const r =
        (command == "peek") ? peek(l, default_value) : (command == "pop") ? pop(l, default_value) : dequeue(l, default_value);
      std::cout << r.first << ' ' << r.second << '\n';
    }
    else {
      std::pair<boost::optional<int64_t>, int_list> const r =
        (command == "peek") ? peek(l) : (command == "pop") ? pop(l) : dequeue(l);
      std::cout << r.first << ' ' << r.second << '\n';
    }
  }
  else if (command == "tree") {
    if (args.size() != 1) { throw po::error("tree takes exactly one bracketed argument"); }
    print_tree(int_tree::from_nested(parse_nested(args[0])));
  }
  else {
    throw po::error("unknown command '" + command + "'");
  }
  return 0;
}

} // unnamed namespace

int main(int argc, char *argv[])
{
  po::options_description desc("Options");
  desc.add_options()
    ("help", "show this message")
    ("verbose", "print diagnostics to stderr")
    ("default", po::value<int64_t>(), "value to report when a stack or queue is empty")
    ("command", po::value<std::string>(), "quicksort, mergesort, search, push, pop, top, enqueue, dequeue, peek or tree")
    ("args", po::value<std::vector<std::string>>()->multitoken(), "operands")
    ;
  po::positional_options_description positional;
  positional.add("command", 1).add("args", -1);

  po::variables_map vm;
  try {
    // No short options, so that negative numbers reach the operands.
    po::store(po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .style(po::command_line_style::unix_style ^ po::command_line_style::allow_short)
                .run(),
              vm);
    po::notify(vm);
  }
  catch (po::error const& e) {
    std::cerr << e.what() << '\n' << desc << '\n';
    return 1;
  }

  if (vm.count("help") || !vm.count("command")) {
    std::cout << "Usage: structured [options] command operands...\n\n"
              << "  search TARGET SORTED...   index of TARGET, or -1\n"
              << "  push|enqueue VALUE LIST...\n"
              << "  tree '[1, [2, 3], 4]'     flatten a tree\n\n"
              << desc << '\n';
    return vm.count("help") ? 0 : 1;
  }
  if (vm.count("verbose")) {
    set_debug_print_ostream(&std::cerr);
  }

  std::vector<std::string> const args =
    vm.count("args") ? vm["args"].as<std::vector<std::string>>() : std::vector<std::string>();
  try {
    return run(vm["command"].as<std::string>(), args, vm);
  }
  catch (po::error const& e) {
    std::cerr << "structured: " << e.what() << '\n';
  }
  catch (notation_error const& e) {
    std::cerr << "structured: " << e.what() << '\n';
  }
  catch (caller_error const& e) {
    std::cerr << "structured: " << e.what() << '\n';
  }
  return 1;
}
