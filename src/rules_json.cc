/*
 * rules_json.cc -- JSON representation of policy rules and requests
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <climits>
#include <cstring>
#include <filesystem>

#include "clearance/debug.hh"
#include "clearance/rules_json.hh"

namespace clearance {

result_t
json_to_value(json_t *j, Value &v) {
  if (!j) {
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  switch (json_typeof(j)) {
  case JSON_NULL:
    v = Value();
    break;
  case JSON_TRUE:
  case JSON_FALSE:
    v = Value(json_is_true(j) ? true : false);
    break;
  case JSON_INTEGER:
    v = Value(static_cast<long long>(json_integer_value(j)));
    break;
  case JSON_REAL:
    v = Value(json_real_value(j));
    break;
  case JSON_STRING:
    v = Value(std::string(json_string_value(j), json_string_length(j)));
    break;
  case JSON_ARRAY: {
    Value::List list;
    size_t index;
    json_t *elem;
    list.reserve(json_array_size(j));
    json_array_foreach(j, index, elem) {
      Value e;
      if (json_to_value(elem, e) != CLEARANCE_OK)
        return CLEARANCE_ERROR_BAD_REQUEST;
      list.push_back(std::move(e));
    }
    v = Value(std::move(list));
    break;
  }
  case JSON_OBJECT:
  default:
    log(CLEARANCE_LOG_WARNING, "json_to_value: cannot represent object\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }
  return CLEARANCE_OK;
}

result_t
json_to_attributes(json_t *j, Attributes &attrs) {
  if (!json_is_object(j)) {
    log(CLEARANCE_LOG_WARNING, "json_to_attributes: not an object\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  Attributes result;
  const char *key;
  json_t *value;
  json_object_foreach(j, key, value) {
    Value v;
    if (json_to_value(value, v) != CLEARANCE_OK) {
      log(CLEARANCE_LOG_WARNING, "json_to_attributes: invalid value for %s\n", key);
      return CLEARANCE_ERROR_BAD_REQUEST;
    }
    result.emplace(key, std::move(v));
  }
  attrs = std::move(result);
  return CLEARANCE_OK;
}

result_t
json_to_condition(const char *path, json_t *j, Conditions &conditions) {
  if (json_is_object(j)) {
    Condition::Operands operands;
    const char *key;
    json_t *value;
    json_object_foreach(j, key, value) {
      const auto op = parse_operator(key);
      if (!op) {
        log(CLEARANCE_LOG_WARNING, "condition %s: unknown operator %s\n", path, key);
        return CLEARANCE_ERROR_BAD_REQUEST;
      }
      Value operand;
      if (json_to_value(value, operand) != CLEARANCE_OK) {
        log(CLEARANCE_LOG_WARNING, "condition %s: invalid operand for %s\n", path, key);
        return CLEARANCE_ERROR_BAD_REQUEST;
      }
      operands.emplace_back(*op, std::move(operand));
    }
    conditions.push_back(Condition::where(path, std::move(operands)));
    return CLEARANCE_OK;
  }

  Value expected;
  if (json_to_value(j, expected) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_WARNING, "condition %s: invalid value\n", path);
    return CLEARANCE_ERROR_BAD_REQUEST;
  }
  conditions.push_back(Condition::equals(path, std::move(expected)));
  return CLEARANCE_OK;
}

/* Reads a string or an array of strings into @p out. */
static result_t
json_to_string_set(json_t *j, std::set<std::string> &out) {
  std::set<std::string> result;

  if (json_is_string(j)) {
    result.insert(json_string_value(j));
  } else if (json_is_array(j)) {
    size_t index;
    json_t *elem;
    json_array_foreach(j, index, elem) {
      if (!json_is_string(elem))
        return CLEARANCE_ERROR_BAD_REQUEST;
      result.insert(json_string_value(elem));
    }
  } else {
    return CLEARANCE_ERROR_BAD_REQUEST;
  }
  out = std::move(result);
  return CLEARANCE_OK;
}

static result_t
json_to_conditions(json_t *j, Conditions &out) {
  if (!json_is_object(j))
    return CLEARANCE_ERROR_BAD_REQUEST;

  Conditions result;
  const char *key;
  json_t *value;
  json_object_foreach(j, key, value) {
    result_t res = json_to_condition(key, value, result);
    if (res != CLEARANCE_OK)
      return res;
  }
  out = std::move(result);
  return CLEARANCE_OK;
}

static result_t
json_to_effect(json_t *j, Effect &effect) {
  if (!json_is_string(j))
    return CLEARANCE_ERROR_BAD_REQUEST;

  const auto e = parse_effect(json_string_value(j));
  if (!e)
    return CLEARANCE_ERROR_BAD_REQUEST;
  effect = *e;
  return CLEARANCE_OK;
}

static result_t
json_to_priority(json_t *j, int &priority) {
  if (!json_is_integer(j))
    return CLEARANCE_ERROR_BAD_REQUEST;

  const json_int_t value = json_integer_value(j);
  if (value < INT_MIN || value > INT_MAX) {
    log(CLEARANCE_LOG_WARNING, "priority %" JSON_INTEGER_FORMAT " out of range\n", value);
    return CLEARANCE_ERROR_BAD_REQUEST;
  }
  priority = static_cast<int>(value);
  return CLEARANCE_OK;
}

result_t
json_to_policy_rule(json_t *j, PolicyRule &rule) {
  if (!json_is_object(j)) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: Invalid JSON\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  json_t *j_id = json_object_get(j, "id");
  if (!j_id)
    j_id = json_object_get(j, "rule_id");
  json_t *j_name = json_object_get(j, "name");
  json_t *j_effect = json_object_get(j, "effect");
  json_t *j_conditions = json_object_get(j, "conditions");
  json_t *j_actions = json_object_get(j, "actions");
  json_t *j_resources = json_object_get(j, "resources");
  json_t *j_priority = json_object_get(j, "priority");
  json_t *j_enabled = json_object_get(j, "enabled");

  if (!json_is_string(j_id) || json_string_length(j_id) == 0) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: missing id\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  PolicyRule r;
  r.id = json_string_value(j_id);

  if (j_name && !json_is_string(j_name)) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: %s: invalid name\n", r.id.c_str());
    return CLEARANCE_ERROR_BAD_REQUEST;
  }
  r.name = j_name ? json_string_value(j_name) : r.id;

  if (json_to_effect(j_effect, r.effect) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: %s: invalid effect\n", r.id.c_str());
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  if (!j_actions || json_to_string_set(j_actions, r.actions) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: %s: invalid actions\n", r.id.c_str());
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  if (j_resources && json_to_string_set(j_resources, r.resources) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: %s: invalid resources\n", r.id.c_str());
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  if (j_conditions && json_to_conditions(j_conditions, r.conditions) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: %s: invalid conditions\n", r.id.c_str());
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  if (j_priority && json_to_priority(j_priority, r.priority) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_rule: %s: invalid priority\n", r.id.c_str());
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  if (j_enabled) {
    if (!json_is_boolean(j_enabled)) {
      log(CLEARANCE_LOG_ERR, "json_to_policy_rule: %s: invalid enabled flag\n", r.id.c_str());
      return CLEARANCE_ERROR_BAD_REQUEST;
    }
    r.enabled = json_is_true(j_enabled);
  }

  rule = std::move(r);
  return CLEARANCE_OK;
}

result_t
json_to_policy_set(json_t *j, PolicyRules &rules) {
  if (json_is_object(j)) {
    j = json_object_get(j, "policies");
  }
  if (!json_is_array(j)) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_set: expected an array of policies\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  PolicyRules result;
  size_t index;
  json_t *elem;
  result.reserve(json_array_size(j));
  json_array_foreach(j, index, elem) {
    PolicyRule rule;
    if (json_to_policy_rule(elem, rule) != CLEARANCE_OK) {
      log(CLEARANCE_LOG_ERR, "json_to_policy_set: rejecting policy set (entry %zu)\n",
          index);
      return CLEARANCE_ERROR_BAD_REQUEST;
    }
    result.push_back(std::move(rule));
  }
  rules = std::move(result);
  return CLEARANCE_OK;
}

result_t
json_to_policy_update(json_t *j, PolicyUpdate &update) {
  if (!json_is_object(j)) {
    log(CLEARANCE_LOG_ERR, "json_to_policy_update: Invalid JSON\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  PolicyUpdate u;
  const char *key;
  json_t *value;
  json_object_foreach(j, key, value) {
    result_t res = CLEARANCE_OK;

    if (strcmp(key, "name") == 0) {
      if (json_is_string(value))
        u.name = json_string_value(value);
      else
        res = CLEARANCE_ERROR_BAD_REQUEST;
    } else if (strcmp(key, "effect") == 0) {
      Effect e;
      res = json_to_effect(value, e);
      if (res == CLEARANCE_OK)
        u.effect = e;
    } else if (strcmp(key, "conditions") == 0) {
      Conditions c;
      res = json_to_conditions(value, c);
      if (res == CLEARANCE_OK)
        u.conditions = std::move(c);
    } else if (strcmp(key, "actions") == 0) {
      std::set<std::string> a;
      res = json_to_string_set(value, a);
      if (res == CLEARANCE_OK)
        u.actions = std::move(a);
    } else if (strcmp(key, "resources") == 0) {
      std::set<std::string> r;
      res = json_to_string_set(value, r);
      if (res == CLEARANCE_OK)
        u.resources = std::move(r);
    } else if (strcmp(key, "priority") == 0) {
      int p;
      res = json_to_priority(value, p);
      if (res == CLEARANCE_OK)
        u.priority = p;
    } else if (strcmp(key, "enabled") == 0) {
      if (json_is_boolean(value))
        u.enabled = json_is_true(value);
      else
        res = CLEARANCE_ERROR_BAD_REQUEST;
    } else {
      log(CLEARANCE_LOG_DEBUG, "json_to_policy_update: ignoring %s\n", key);
    }

    if (res != CLEARANCE_OK) {
      log(CLEARANCE_LOG_ERR, "json_to_policy_update: invalid value for %s\n", key);
      return res;
    }
  }
  update = std::move(u);
  return CLEARANCE_OK;
}

result_t
json_to_request(json_t *j, Request &request) {
  if (!json_is_object(j)) {
    log(CLEARANCE_LOG_ERR, "json_to_request: Invalid JSON\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  json_t *j_user = json_object_get(j, "user");
  json_t *j_resource = json_object_get(j, "resource");
  json_t *j_action = json_object_get(j, "action");
  json_t *j_context = json_object_get(j, "context");

  Request r;
  if (!json_is_string(j_action)
      || json_to_attributes(j_user, r.user) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_ERR, "json_to_request: user and action are required\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }
  r.action = json_string_value(j_action);

  if (j_resource && json_to_attributes(j_resource, r.resource) != CLEARANCE_OK) {
    log(CLEARANCE_LOG_ERR, "json_to_request: invalid resource\n");
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  if (j_context && !json_is_null(j_context)) {
    Attributes context;
    if (json_to_attributes(j_context, context) != CLEARANCE_OK) {
      log(CLEARANCE_LOG_ERR, "json_to_request: invalid context\n");
      return CLEARANCE_ERROR_BAD_REQUEST;
    }
    r.context = std::move(context);
  }

  request = std::move(r);
  return CLEARANCE_OK;
}

result_t
load_policy_file(const std::string &filename, PolicyRules &rules) {
  std::error_code err;
  if (!std::filesystem::exists(filename, err)) {
    log(CLEARANCE_LOG_ERR, "cannot find policy file %s\n", filename.c_str());
    return CLEARANCE_ERROR_NOT_FOUND;
  }

  json_error_t error;
  json_ptr j{json_load_file(filename.c_str(), 0, &error)};
  if (!j) {
    log(CLEARANCE_LOG_ERR, "%s:%d: %s\n", filename.c_str(), error.line, error.text);
    return CLEARANCE_ERROR_BAD_REQUEST;
  }

  result_t res = json_to_policy_set(j.get(), rules);
  if (res == CLEARANCE_OK) {
    log(CLEARANCE_LOG_INFO, "loaded %zu rules from %s\n", rules.size(), filename.c_str());
  }
  return res;
}

json_ptr
value_to_json(const Value &v) {
  switch (v.type()) {
  case Value::Type::Null: return json_ptr{json_null()};
  case Value::Type::Bool: return json_ptr{json_boolean(v.as_bool())};
  case Value::Type::Integer: return json_ptr{json_integer(v.as_integer())};
  case Value::Type::Real: return json_ptr{json_real(v.as_real())};
  case Value::Type::String:
    return json_ptr{json_stringn(v.as_string().data(), v.as_string().size())};
  case Value::Type::List: {
    json_ptr array{json_array()};
    for (const auto &elem : v.as_list()) {
      json_array_append_new(array.get(), value_to_json(elem).release());
    }
    return array;
  }
  }
  return json_ptr{json_null()};
}

static json_ptr
string_set_to_json(const std::set<std::string> &set) {
  json_ptr array{json_array()};
  for (const auto &s : set) {
    json_array_append_new(array.get(), json_string(s.c_str()));
  }
  return array;
}

/* Adds @p value as operand @p op to the operator object @p expected. */
static void
add_operand(json_t *expected, const std::string &path, Operator op, json_ptr value) {
  const char *name = to_string(op);
  if (json_object_get(expected, name)) {
    log(CLEARANCE_LOG_WARNING, "policy_rule_to_json: %s: dropping second %s\n",
        path.c_str(), name);
    return;
  }
  json_object_set_new(expected, name, value.release());
}

json_ptr
policy_rule_to_json(const PolicyRule &rule) {
  json_ptr conditions{json_object()};
  for (const auto &c : rule.conditions) {
    json_t *expected = json_object_get(conditions.get(), c.path().c_str());

    if (!expected) {
      if (c.kind() == Condition::Kind::Operators) {
        expected = json_object();
        for (const auto &o : c.operands()) {
          add_operand(expected, c.path(), o.first, value_to_json(o.second));
        }
      } else {
        expected = value_to_json(c.expected()).release();
      }
      json_object_set_new(conditions.get(), c.path().c_str(), expected);
      continue;
    }

    /* Conditions on the same path are merged into one operator
     * object. A literal becomes $eq, a list becomes $in. */
    if (!json_is_object(expected)) {
      json_t *merged = json_object();
      json_object_set(merged, to_string(json_is_array(expected) ? Operator::in : Operator::eq),
                      expected);
      json_object_set_new(conditions.get(), c.path().c_str(), merged);
      expected = merged;
    }

    switch (c.kind()) {
    case Condition::Kind::Operators:
      for (const auto &o : c.operands()) {
        add_operand(expected, c.path(), o.first, value_to_json(o.second));
      }
      break;
    case Condition::Kind::List:
      add_operand(expected, c.path(), Operator::in, value_to_json(c.expected()));
      break;
    case Condition::Kind::Literal:
      add_operand(expected, c.path(), Operator::eq, value_to_json(c.expected()));
      break;
    }
  }

  json_ptr j{json_object()};
  json_object_set_new(j.get(), "id", json_string(rule.id.c_str()));
  json_object_set_new(j.get(), "name", json_string(rule.name.c_str()));
  json_object_set_new(j.get(), "effect", json_string(to_string(rule.effect)));
  json_object_set_new(j.get(), "conditions", conditions.release());
  json_object_set_new(j.get(), "actions", string_set_to_json(rule.actions).release());
  json_object_set_new(j.get(), "resources", string_set_to_json(rule.resources).release());
  json_object_set_new(j.get(), "priority", json_integer(rule.priority));
  json_object_set_new(j.get(), "enabled", json_boolean(rule.enabled));
  return j;
}

json_ptr
policy_set_to_json(const PolicyRules &rules) {
  json_ptr array{json_array()};
  for (const auto &rule : rules) {
    json_array_append_new(array.get(), policy_rule_to_json(rule).release());
  }

  json_ptr j{json_object()};
  json_object_set_new(j.get(), "policies", array.release());
  return j;
}

} /* namespace clearance */
