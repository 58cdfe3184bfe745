/*
 * condition.cc -- attribute conditions of ABAC policy rules
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <algorithm>

#include "clearance/condition.hh"
#include "clearance/debug.hh"

namespace clearance {

static const struct {
  const char *name;
  Operator op;
} operatorNames[] = {
  { "$eq", Operator::eq }, { "=", Operator::eq },
  { "$ne", Operator::ne }, { "!=", Operator::ne },
  { "$in", Operator::in },
  { "$nin", Operator::not_in }, { "$not_in", Operator::not_in },
  { "$gte", Operator::gte }, { ">=", Operator::gte },
  { "$lte", Operator::lte }, { "<=", Operator::lte },
  { "$gt", Operator::gt }, { ">", Operator::gt },
  { "$lt", Operator::lt }, { "<", Operator::lt },
  { "$ref", Operator::ref }
};

std::optional<Operator>
parse_operator(const std::string &s) {
  for (const auto &entry : operatorNames) {
    if (s == entry.name)
      return entry.op;
  }
  return std::nullopt;
}

const char *
to_string(Operator op) {
  /* the first entry for each operator is its canonical name */
  for (const auto &entry : operatorNames) {
    if (entry.op == op)
      return entry.name;
  }
  return "?";
}

const Value *
resolve(const EvaluationContext &ctx, const std::string &path) {
  const auto dot = path.find('.');
  if (dot == std::string::npos)
    return nullptr;

  const std::string ns{path.substr(0, dot)};
  const std::string field{path.substr(dot + 1)};

  if (ns == "user")
    return &lookup(ctx.user, field);
  if (ns == "resource")
    return &lookup(ctx.resource, field);
  if (ns == "context")
    return &lookup(ctx.context, field);
  if (ns == "action")
    return &lookup(ctx.context, "action");
  return nullptr;
}

static inline bool
ordered(const Value &actual, const Value &operand, bool (*pred)(int)) {
  const auto c = actual.compare(operand);
  return c && pred(*c);
}

bool
apply_operator(Operator op, const Value &actual, const Value &operand,
               const EvaluationContext &ctx) {
  switch (op) {
  case Operator::eq: return actual == operand;
  case Operator::ne: return actual != operand;
  case Operator::in: return operand.contains(actual);
  case Operator::not_in: return operand.is_list() && !operand.contains(actual);
  case Operator::gte: return ordered(actual, operand, [](int c) { return c >= 0; });
  case Operator::lte: return ordered(actual, operand, [](int c) { return c <= 0; });
  case Operator::gt: return ordered(actual, operand, [](int c) { return c > 0; });
  case Operator::lt: return ordered(actual, operand, [](int c) { return c < 0; });
  case Operator::ref: {
    if (!operand.is_string())
      return false;
    const Value *other = resolve(ctx, operand.as_string());
    /* both sides must be present for a reference to match */
    return other && !other->is_null() && !actual.is_null() && actual == *other;
  }
  }
  return false;
}

Condition
Condition::equals(std::string path, Value expected) {
  Condition c{std::move(path), expected.is_list() ? Kind::List : Kind::Literal};
  c.expected_ = std::move(expected);
  return c;
}

Condition
Condition::member_of(std::string path, Value::List expected) {
  Condition c{std::move(path), Kind::List};
  c.expected_ = Value(std::move(expected));
  return c;
}

Condition
Condition::where(std::string path, Operands operands) {
  Condition c{std::move(path), Kind::Operators};
  c.operands_ = std::move(operands);
  return c;
}

bool
Condition::matches(const EvaluationContext &ctx) const {
  const Value *actual = resolve(ctx, path_);
  if (!actual) {
    log(CLEARANCE_LOG_DEBUG, "skip condition on %s\n", path_.c_str());
    return true;
  }

  switch (kind_) {
  case Kind::Literal: return *actual == expected_;
  case Kind::List: return expected_.contains(*actual);
  case Kind::Operators:
    return std::all_of(operands_.begin(), operands_.end(),
                       [&](const Operand &o) {
                         return apply_operator(o.first, *actual, o.second, ctx);
                       });
  }
  return false;
}

bool
evaluate_conditions(const Conditions &conditions, const EvaluationContext &ctx) {
  return std::all_of(conditions.begin(), conditions.end(),
                     [&ctx](const Condition &c) { return c.matches(ctx); });
}

} /* namespace clearance */
