/*
 * condition.hh -- attribute conditions of ABAC policy rules
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_CONDITION_HH_
#define _CLEARANCE_CONDITION_HH_ 1

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "clearance/value.hh"

namespace clearance {

/** Comparison operators usable in operator conditions. */
enum class Operator : uint8_t {
  eq,                           /**< $eq, = */
  ne,                           /**< $ne, != */
  in,                           /**< $in */
  not_in,                       /**< $nin, $not_in */
  gte,                          /**< $gte, >= */
  lte,                          /**< $lte, <= */
  gt,                           /**< $gt, > */
  lt,                           /**< $lt, < */
  ref                           /**< $ref: equal to the value at another path */
};

/**
 * Parses an operator name. Both the "$name" and the symbolic form are
 * accepted. Returns an empty optional for unknown names.
 */
std::optional<Operator> parse_operator(const std::string &s);

/** Canonical "$name" form of @p op. */
const char *to_string(Operator op);

/**
 * The attributes a request is evaluated against. The members refer
 * to caller-owned data that must outlive the evaluation.
 */
struct EvaluationContext {
  const Attributes &user;
  const Attributes &resource;
  const Attributes &context;
  const std::string &action;
};

/**
 * Looks up the attribute named by the dotted @p path in @p ctx. The
 * namespaces "user", "resource" and "context" refer to the respective
 * buckets; "action" refers to context["action"]. Missing attributes
 * yield a null Value. Returns nullptr if @p path has no namespace or
 * the namespace is unknown.
 */
const Value *resolve(const EvaluationContext &ctx, const std::string &path);

/**
 * Applies @p op to @p actual and @p operand. Type mismatches yield
 * @c false.
 */
bool apply_operator(Operator op, const Value &actual, const Value &operand,
                    const EvaluationContext &ctx);

/**
 * A single condition: a dotted attribute path and the expectation on
 * the attribute's value.
 *
 * A literal expectation is compared by equality, a list expectation
 * by membership. An operator expectation holds if all of its
 * operators hold. Note that a literal string that looks like a path
 * ("user.id") is still a literal; use Operator::ref to compare two
 * attributes.
 */
class Condition {
public:
  enum class Kind : uint8_t { Literal, List, Operators };
  using Operand = std::pair<Operator, Value>;
  using Operands = std::vector<Operand>;

  /** Equality with @p expected, or membership if @p expected is a list. */
  static Condition equals(std::string path, Value expected);

  /** Membership in @p expected. */
  static Condition member_of(std::string path, Value::List expected);

  /** All @p operands must hold. */
  static Condition where(std::string path, Operands operands);

  const std::string &path(void) const { return path_; }
  Kind kind(void) const { return kind_; }
  const Value &expected(void) const { return expected_; }
  const Operands &operands(void) const { return operands_; }

  /**
   * Evaluates the condition against @p ctx. Conditions whose path
   * cannot be resolved are skipped, i.e., they hold.
   */
  bool matches(const EvaluationContext &ctx) const;

private:
  Condition(std::string path, Kind kind) : path_(std::move(path)), kind_(kind) {}

  std::string path_;
  Kind kind_;
  Value expected_;
  Operands operands_;
};

using Conditions = std::vector<Condition>;

/** Returns @c true if all @p conditions hold for @p ctx. */
bool evaluate_conditions(const Conditions &conditions,
                         const EvaluationContext &ctx);

} /* namespace clearance */

#endif /* _CLEARANCE_CONDITION_HH_ */
