#include "applogic/value.hpp"

#include <cmath>

#include "applogic/jsonlite.hpp"

namespace applogic {

std::string to_string(ValueType type) {
  switch (type) {
    case ValueType::null:    return "null";
    case ValueType::boolean: return "boolean";
    case ValueType::number:  return "number";
    case ValueType::string:  return "string";
    case ValueType::list:    return "list";
    case ValueType::map:     return "map";
  }
  return "null";
}

bool operator==(const Value& a, const Value& b) {
  if (a.v.index() != b.v.index()) return false;
  switch (a.type()) {
    case ValueType::null:    return true;
    case ValueType::boolean: return a.as_bool() == b.as_bool();
    case ValueType::number:  return a.as_number() == b.as_number();
    case ValueType::string:  return a.as_string() == b.as_string();
    case ValueType::list: {
      const List& la = a.as_list();
      const List& lb = b.as_list();
      if (la.size() != lb.size()) return false;
      for (std::size_t i = 0; i < la.size(); ++i) {
        if (!(la[i] == lb[i])) return false;
      }
      return true;
    }
    case ValueType::map: {
      const Map& ma = a.as_map();
      const Map& mb = b.as_map();
      if (ma.size() != mb.size()) return false;
      auto ia = ma.begin();
      auto ib = mb.begin();
      for (; ia != ma.end(); ++ia, ++ib) {
        if (ia->first != ib->first || !(ia->second == ib->second)) return false;
      }
      return true;
    }
  }
  return false;
}

std::string to_display_string(const Value& value) {
  switch (value.type()) {
    case ValueType::null:    return "";
    case ValueType::boolean: return value.as_bool() ? "true" : "false";
    case ValueType::number:  return jsonlite::format_number(value.as_number());
    case ValueType::string:  return value.as_string();
    case ValueType::list:
    case ValueType::map:
      return jsonlite::to_json(value);
  }
  return "";
}

bool truthy(const Value& value) {
  switch (value.type()) {
    case ValueType::null:    return false;
    case ValueType::boolean: return value.as_bool();
    case ValueType::number:  return value.as_number() != 0.0;
    case ValueType::string:  return !value.as_string().empty();
    case ValueType::list:    return !value.as_list().empty();
    case ValueType::map:     return !value.as_map().empty();
  }
  return false;
}

bool is_integral(double d) {
  return std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9007199254740992.0;
}

}  // namespace applogic
