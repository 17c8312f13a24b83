#pragma once

// applogic/path.hpp - Dotted/bracketed addressing into Value trees.
//
// A Path such as `balances.alice` or `items[0].price` is a sequence of key and
// index segments. Reads come in two flavours: get_path() is permissive (the
// expression language reads missing data as null) and find_path() is strict
// (reports path_not_found / type_mismatch). Writes go through apply_update(),
// which is always strict about anything it cannot create.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "applogic/types.hpp"
#include "applogic/value.hpp"

namespace applogic {

struct PathSegment {
  enum class Kind { key, index };
  Kind        kind{Kind::key};
  std::string key;
  std::size_t index{0};

  static PathSegment of_key(std::string k) { return PathSegment{Kind::key, std::move(k), 0}; }
  static PathSegment of_index(std::size_t i) { return PathSegment{Kind::index, {}, i}; }

  bool operator==(const PathSegment&) const = default;
};

using Path = std::vector<PathSegment>;

// Parse "a.b[2].c". Keys are identifier-like ([A-Za-z_][A-Za-z0-9_]*);
// indices are non-negative decimal integers.
std::optional<Path> parse_path(std::string_view text, std::optional<Error>* error);
std::string path_to_string(const Path& path);

// Permissive read. Returns nullptr when any segment is missing or the
// container kind does not match the segment kind.
const Value* get_path(const Value& root, const Path& path);

// Strict read. On failure returns nullptr and reports path_not_found or
// type_mismatch through *error.
const Value* find_path(const Value& root, const Path& path, std::optional<Error>* error);

enum class UpdateOp {
  set,
  increment,
  decrement,
  append,
  remove,
  merge,
};

std::string to_string(UpdateOp op);
std::optional<UpdateOp> update_op_from_string(const std::string& s);

// Apply one mutation at `path` under `root`. `path` must be non-empty.
//   set        replace (or create) the target.
//   increment  target (missing = 0) += operand; both must be numbers.
//   decrement  target (missing = 0) -= operand; both must be numbers.
//   append     push operand onto the target list (missing = new list).
//   remove     erase the first element equal to operand (missing = no-op).
//   merge      shallow key union into the target map, operand keys win.
// Missing intermediate map keys are created. Index segments never create.
std::optional<Error> apply_update(Map& root, const Path& path, UpdateOp op, const Value& operand);

}  // namespace applogic
