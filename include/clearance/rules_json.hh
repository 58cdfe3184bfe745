/*
 * rules_json.hh -- JSON representation of policy rules and requests
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_RULES_JSON_HH_
#define _CLEARANCE_RULES_JSON_HH_ 1

#include <memory>
#include <optional>
#include <string>

#include <jansson.h>

#include "clearance/clearance.hh"

namespace clearance {

/* Helper structure to release jansson objects held in smart pointers. */
struct json_deleter {
  void operator()(json_t *j) const { json_decref(j); }
};

using json_ptr = std::unique_ptr<json_t, json_deleter>;

/** An access request as read by json_to_request(). */
struct Request {
  Attributes user;
  Attributes resource;
  std::string action;
  std::optional<Attributes> context;
};

/**
 * Converts the JSON value @p j to @p v. Objects cannot be represented
 * as a Value.
 * @return CLEARANCE_OK on success, CLEARANCE_ERROR_BAD_REQUEST if @p j
 *         is or contains an object.
 */
result_t json_to_value(json_t *j, Value &v);

/**
 * Parses the JSON object @p j as attribute bucket and stores the
 * result in @p attrs.
 */
result_t json_to_attributes(json_t *j, Attributes &attrs);

/**
 * Parses the expectation @p j for the attribute @p path and appends
 * the resulting condition to @p conditions. An object is read as
 * operator object; unknown operator names are rejected.
 */
result_t json_to_condition(const char *path, json_t *j, Conditions &conditions);

/**
 * Parses the @p json object to a PolicyRule and stores the result in
 * @p rule. The fields "id" (or "rule_id"), "effect" and "actions" are
 * required.
 * @return CLEARANCE_OK if the parsing succeeds,
 *         CLEARANCE_ERROR_BAD_REQUEST otherwise.
 */
result_t json_to_policy_rule(json_t *j, PolicyRule &rule);

/**
 * Parses a policy set, i.e., either an array of rules or an object
 * with the member "policies" holding such an array. Either all rules
 * are parsed and stored in @p rules, or @p rules is left untouched.
 */
result_t json_to_policy_set(json_t *j, PolicyRules &rules);

/**
 * Parses the field map @p j into @p update. Members that do not name
 * an updatable field are ignored.
 * @return CLEARANCE_OK on success, CLEARANCE_ERROR_BAD_REQUEST if
 *         a known field has an invalid value.
 */
result_t json_to_policy_update(json_t *j, PolicyUpdate &update);

/**
 * Parses the request object @p j with the members "user",
 * "resource", "action" and the optional "context".
 */
result_t json_to_request(json_t *j, Request &request);

/**
 * Reads the policy set stored in @p filename.
 * @return CLEARANCE_OK on success, CLEARANCE_ERROR_NOT_FOUND if the
 *         file does not exist, CLEARANCE_ERROR_BAD_REQUEST if it
 *         does not contain a valid policy set.
 */
result_t load_policy_file(const std::string &filename, PolicyRules &rules);

/* Conversions to JSON. The caller owns the result. */
json_ptr value_to_json(const Value &v);
json_ptr policy_rule_to_json(const PolicyRule &rule);
json_ptr policy_set_to_json(const PolicyRules &rules);

} /* namespace clearance */

#endif /* _CLEARANCE_RULES_JSON_HH_ */
