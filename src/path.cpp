#include "applogic/path.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace applogic {

namespace {

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

std::string describe(const Path& path, std::size_t upto) {
  Path prefix(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(upto));
  return prefix.empty() ? std::string("<root>") : path_to_string(prefix);
}

// Walks to the container holding the final segment, creating intermediate
// maps when `create` is set.
Value* walk_parent(Map& root, const Path& path, bool create, std::optional<Error>* error) {
  Value* cur = nullptr;
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    const PathSegment& seg = path[i];
    const PathSegment& next = path[i + 1];
    Map* as_map = nullptr;
    if (i == 0) {
      as_map = &root;
    } else if (cur->is_map()) {
      as_map = &cur->as_map();
    }

    if (seg.kind == PathSegment::Kind::key) {
      if (!as_map) {
        *error = make_error(ErrorCode::type_mismatch,
                            "cannot read key '" + seg.key + "' of " + to_string(cur->type()) +
                                " at " + describe(path, i));
        return nullptr;
      }
      auto it = as_map->find(seg.key);
      if (it == as_map->end() || it->second.is_null()) {
        if (!create || next.kind == PathSegment::Kind::index) {
          *error = make_error(ErrorCode::path_not_found, "path not found: " + describe(path, i + 1));
          return nullptr;
        }
        Value& slot = (*as_map)[seg.key];
        slot = Value{Map{}};
        cur = &slot;
      } else {
        cur = &it->second;
      }
      continue;
    }

    if (i == 0 || !cur->is_list()) {
      *error = make_error(ErrorCode::type_mismatch,
                          "cannot index " + std::string(i == 0 ? "map" : to_string(cur->type())) +
                              " at " + describe(path, i));
      return nullptr;
    }
    List& list = cur->as_list();
    if (seg.index >= list.size()) {
      *error = make_error(ErrorCode::path_not_found, "index out of range: " + describe(path, i + 1));
      return nullptr;
    }
    cur = &list[seg.index];
  }
  return cur;
}

std::optional<Error> apply_to_slot(Value* slot, bool existed, UpdateOp op, const Value& operand,
                                   const std::string& where) {
  switch (op) {
    case UpdateOp::set:
      *slot = operand;
      return std::nullopt;
    case UpdateOp::increment:
    case UpdateOp::decrement: {
      if (!operand.is_number()) {
        return make_error(ErrorCode::type_mismatch,
                          to_string(op) + " needs a number operand, got " + to_string(operand.type()));
      }
      double base = 0.0;
      if (existed && !slot->is_null()) {
        if (!slot->is_number()) {
          return make_error(ErrorCode::type_mismatch,
                            to_string(op) + " target " + where + " is " + to_string(slot->type()) +
                                ", not number");
        }
        base = slot->as_number();
      }
      const double next = op == UpdateOp::increment ? base + operand.as_number() : base - operand.as_number();
      if (!std::isfinite(next)) {
        return make_error(ErrorCode::invalid_argument, "numeric overflow in " + to_string(op) + " of " + where);
      }
      *slot = Value{next};
      return std::nullopt;
    }
    case UpdateOp::append:
      if (!existed || slot->is_null()) {
        *slot = Value{List{operand}};
        return std::nullopt;
      }
      if (!slot->is_list()) {
        return make_error(ErrorCode::type_mismatch,
                          "append target " + where + " is " + to_string(slot->type()) + ", not list");
      }
      slot->as_list().push_back(operand);
      return std::nullopt;
    case UpdateOp::remove: {
      if (!slot->is_list()) {
        return make_error(ErrorCode::type_mismatch,
                          "remove target " + where + " is " + to_string(slot->type()) + ", not list");
      }
      List& list = slot->as_list();
      auto it = std::find(list.begin(), list.end(), operand);
      if (it != list.end()) list.erase(it);
      return std::nullopt;
    }
    case UpdateOp::merge:
      if (!operand.is_map()) {
        return make_error(ErrorCode::type_mismatch,
                          "merge needs a map operand, got " + to_string(operand.type()));
      }
      if (!existed || slot->is_null()) {
        *slot = operand;
        return std::nullopt;
      }
      if (!slot->is_map()) {
        return make_error(ErrorCode::type_mismatch,
                          "merge target " + where + " is " + to_string(slot->type()) + ", not map");
      }
      for (const auto& [k, v] : operand.as_map()) slot->as_map()[k] = v;
      return std::nullopt;
  }
  return make_error(ErrorCode::internal_error, "unhandled update operation");
}

}  // namespace

std::optional<Path> parse_path(std::string_view text, std::optional<Error>* error) {
  Path out;
  std::size_t i = 0;
  auto fail = [&](const std::string& msg) -> std::optional<Path> {
    if (error) {
      *error = make_error(ErrorCode::parse_error,
                          msg + " at offset " + std::to_string(i) + " in path '" + std::string(text) + "'");
    }
    return std::nullopt;
  };

  bool expect_key = true;
  while (i < text.size()) {
    if (expect_key) {
      if (!is_ident_start(text[i])) return fail("expected field name");
      std::size_t start = i;
      while (i < text.size() && is_ident_char(text[i])) ++i;
      out.push_back(PathSegment::of_key(std::string(text.substr(start, i - start))));
      expect_key = false;
      continue;
    }
    if (text[i] == '.') {
      ++i;
      expect_key = true;
      continue;
    }
    if (text[i] == '[') {
      ++i;
      std::size_t start = i;
      while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
      if (i == start || i >= text.size() || text[i] != ']') return fail("expected index");
      if (i - start > 9) return fail("index too large");
      out.push_back(PathSegment::of_index(std::stoul(std::string(text.substr(start, i - start)))));
      ++i;
      continue;
    }
    return fail("unexpected character");
  }
  if (expect_key) return fail("path must not be empty or end with '.'");
  return out;
}

std::string path_to_string(const Path& path) {
  std::string out;
  for (const auto& seg : path) {
    if (seg.kind == PathSegment::Kind::key) {
      if (!out.empty()) out += '.';
      out += seg.key;
    } else {
      out += '[';
      out += std::to_string(seg.index);
      out += ']';
    }
  }
  return out;
}

const Value* get_path(const Value& root, const Path& path) {
  const Value* cur = &root;
  for (const auto& seg : path) {
    if (seg.kind == PathSegment::Kind::key) {
      if (!cur->is_map()) return nullptr;
      auto it = cur->as_map().find(seg.key);
      if (it == cur->as_map().end()) return nullptr;
      cur = &it->second;
    } else {
      if (!cur->is_list() || seg.index >= cur->as_list().size()) return nullptr;
      cur = &cur->as_list()[seg.index];
    }
  }
  return cur;
}

const Value* find_path(const Value& root, const Path& path, std::optional<Error>* error) {
  const Value* cur = &root;
  for (std::size_t i = 0; i < path.size(); ++i) {
    const PathSegment& seg = path[i];
    if (seg.kind == PathSegment::Kind::key) {
      if (!cur->is_map()) {
        if (error) {
          *error = make_error(ErrorCode::type_mismatch, "cannot read key '" + seg.key + "' of " +
                                                            to_string(cur->type()) + " at " + describe(path, i));
        }
        return nullptr;
      }
      auto it = cur->as_map().find(seg.key);
      if (it == cur->as_map().end()) {
        if (error) *error = make_error(ErrorCode::path_not_found, "path not found: " + describe(path, i + 1));
        return nullptr;
      }
      cur = &it->second;
    } else {
      if (!cur->is_list()) {
        if (error) {
          *error = make_error(ErrorCode::type_mismatch,
                              "cannot index " + to_string(cur->type()) + " at " + describe(path, i));
        }
        return nullptr;
      }
      if (seg.index >= cur->as_list().size()) {
        if (error) *error = make_error(ErrorCode::path_not_found, "index out of range: " + describe(path, i + 1));
        return nullptr;
      }
      cur = &cur->as_list()[seg.index];
    }
  }
  return cur;
}

std::string to_string(UpdateOp op) {
  switch (op) {
    case UpdateOp::set:       return "set";
    case UpdateOp::increment: return "increment";
    case UpdateOp::decrement: return "decrement";
    case UpdateOp::append:    return "append";
    case UpdateOp::remove:    return "remove";
    case UpdateOp::merge:     return "merge";
  }
  return "set";
}

std::optional<UpdateOp> update_op_from_string(const std::string& s) {
  if (s == "set")                         return UpdateOp::set;
  if (s == "increment" || s == "add")     return UpdateOp::increment;
  if (s == "decrement" || s == "subtract") return UpdateOp::decrement;
  if (s == "append")                      return UpdateOp::append;
  if (s == "remove")                      return UpdateOp::remove;
  if (s == "merge")                       return UpdateOp::merge;
  return std::nullopt;
}

std::optional<Error> apply_update(Map& root, const Path& path, UpdateOp op, const Value& operand) {
  if (path.empty()) return make_error(ErrorCode::path_not_found, "update target path is empty");

  std::optional<Error> err;
  const bool create = op != UpdateOp::remove;
  Value* parent = walk_parent(root, path, create, &err);
  if (err) {
    if (op == UpdateOp::remove && err->code == ErrorCode::path_not_found) return std::nullopt;
    return err;
  }

  const PathSegment& last = path.back();
  const std::string where = path_to_string(path);
  Map* parent_map = parent ? (parent->is_map() ? &parent->as_map() : nullptr) : &root;

  if (last.kind == PathSegment::Kind::key) {
    if (!parent_map) {
      return make_error(ErrorCode::type_mismatch,
                        "cannot write key '" + last.key + "' into " + to_string(parent->type()) +
                            " at " + describe(path, path.size() - 1));
    }
    auto it = parent_map->find(last.key);
    if (it == parent_map->end()) {
      if (op == UpdateOp::remove) return std::nullopt;
      Value fresh;
      if (auto e = apply_to_slot(&fresh, false, op, operand, where)) return e;
      parent_map->emplace(last.key, std::move(fresh));
      return std::nullopt;
    }
    if (op == UpdateOp::remove && it->second.is_null()) return std::nullopt;
    return apply_to_slot(&it->second, true, op, operand, where);
  }

  if (!parent || !parent->is_list()) {
    return make_error(ErrorCode::type_mismatch,
                      "cannot index " + std::string(parent ? to_string(parent->type()) : "map") +
                          " at " + describe(path, path.size() - 1));
  }
  List& list = parent->as_list();
  if (last.index >= list.size()) {
    if (op == UpdateOp::remove) return std::nullopt;
    return make_error(ErrorCode::path_not_found, "index out of range: " + where);
  }
  return apply_to_slot(&list[last.index], true, op, operand, where);
}

}  // namespace applogic
