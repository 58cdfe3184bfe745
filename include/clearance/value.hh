/*
 * value.hh -- attribute values for the Clearance policy engine
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_VALUE_HH_
#define _CLEARANCE_VALUE_HH_ 1

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace clearance {

/**
 * An attribute value as supplied by callers and as used in policy
 * conditions. A Value is either null, a boolean, an integer, a real
 * number, a string or a list of values.
 */
class Value {
public:
  enum class Type : uint8_t { Null, Bool, Integer, Real, String, List };
  using List = std::vector<Value>;

  Value(void) : data(std::monostate{}) {}
  Value(std::nullptr_t) : data(std::monostate{}) {}
  Value(bool b) : data(b) {}
  Value(int i) : data(static_cast<int64_t>(i)) {}
  Value(long i) : data(static_cast<int64_t>(i)) {}
  Value(long long i) : data(static_cast<int64_t>(i)) {}
  Value(double d) : data(d) {}
  Value(const char *s) : data(std::string(s)) {}
  Value(std::string s) : data(std::move(s)) {}
  Value(List l) : data(std::move(l)) {}
  Value(std::initializer_list<Value> l) : data(List(l)) {}

  Type type(void) const { return static_cast<Type>(data.index()); }

  bool is_null(void) const { return type() == Type::Null; }
  bool is_bool(void) const { return type() == Type::Bool; }
  bool is_integer(void) const { return type() == Type::Integer; }
  bool is_real(void) const { return type() == Type::Real; }
  bool is_number(void) const {
    return type() == Type::Integer || type() == Type::Real;
  }
  bool is_string(void) const { return type() == Type::String; }
  bool is_list(void) const { return type() == Type::List; }

  /* The accessors require the matching type. */
  bool as_bool(void) const { return std::get<bool>(data); }
  int64_t as_integer(void) const { return std::get<int64_t>(data); }
  const std::string &as_string(void) const { return std::get<std::string>(data); }
  const List &as_list(void) const { return std::get<List>(data); }

  /** Integer or real value as double. Requires is_number(). */
  double as_real(void) const;

  /**
   * Returns true if this is a list and one of its elements equals
   * @p v.
   */
  bool contains(const Value &v) const;

  /**
   * Orders this value relative to @p other. Only number/number and
   * string/string pairs are ordered; for all other combinations the
   * result is empty.
   */
  std::optional<int> compare(const Value &other) const;

  friend bool operator==(const Value &a, const Value &b);
  friend bool operator!=(const Value &a, const Value &b) { return !(a == b); }

private:
  std::variant<std::monostate, bool, int64_t, double, std::string, List> data;
};

std::ostream &operator<<(std::ostream &os, const Value &v);

/** Attribute bucket: attribute name to value. */
using Attributes = std::map<std::string, Value>;

/**
 * Returns the value stored under @p name in @p attrs or a null Value
 * if there is none.
 */
const Value &lookup(const Attributes &attrs, const std::string &name);

} /* namespace clearance */

#endif /* _CLEARANCE_VALUE_HH_ */
