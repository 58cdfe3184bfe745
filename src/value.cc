/*
 * value.cc -- attribute values for the Clearance policy engine
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <iomanip>

#include "clearance/value.hh"

namespace clearance {

double
Value::as_real(void) const {
  if (type() == Type::Integer)
    return static_cast<double>(std::get<int64_t>(data));
  return std::get<double>(data);
}

bool
Value::contains(const Value &v) const {
  if (!is_list())
    return false;
  const List &l = as_list();
  return std::find(l.begin(), l.end(), v) != l.end();
}

std::optional<int>
Value::compare(const Value &other) const {
  if (type() == Type::Integer && other.type() == Type::Integer) {
    int64_t a = as_integer(), b = other.as_integer();
    return (a < b) ? -1 : (a > b);
  }
  if (is_number() && other.is_number()) {
    double a = as_real(), b = other.as_real();
    if (a < b)
      return -1;
    if (a > b)
      return 1;
    if (a == b)
      return 0;
    return std::nullopt;        /* NaN */
  }
  if (is_string() && other.is_string()) {
    int c = as_string().compare(other.as_string());
    return (c < 0) ? -1 : (c > 0);
  }
  return std::nullopt;
}

bool
operator==(const Value &a, const Value &b) {
  if (a.is_number() && b.is_number()) {
    auto c = a.compare(b);
    return c && *c == 0;
  }
  return a.data == b.data;
}

std::ostream &
operator<<(std::ostream &os, const Value &v) {
  switch (v.type()) {
  case Value::Type::Null: return os << "null";
  case Value::Type::Bool: return os << (v.as_bool() ? "true" : "false");
  case Value::Type::Integer: return os << v.as_integer();
  case Value::Type::Real: return os << v.as_real();
  case Value::Type::String: return os << std::quoted(v.as_string());
  case Value::Type::List: {
    os << '[';
    bool first = true;
    for (const auto &elem : v.as_list()) {
      if (!first)
        os << ", ";
      os << elem;
      first = false;
    }
    return os << ']';
  }
  }
  return os;
}

const Value &
lookup(const Attributes &attrs, const std::string &name) {
  static const Value null_value;
  const auto &elem{attrs.find(name)};
  return elem != attrs.end() ? elem->second : null_value;
}

} /* namespace clearance */
