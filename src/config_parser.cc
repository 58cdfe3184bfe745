/*
 * config_parser.cc -- YAML configuration of the Clearance library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iterator>

#include "clearance/config_parser.hh"
#include "clearance/rules_json.hh"

namespace clearance {
namespace config {

std::string
getDefaultConfigFile(void) {
  char *home = getenv("HOME");
  std::filesystem::path root{"/"};
  std::error_code err;

  if (home) { /* check if $HOME/.clearancerc or $HOME/.local/clearance/clearancerc exists */
    /* these are the paths under $HOME to search for the config file */
    static const char *local_searchpaths[] = { ".clearancerc", ".local/clearance/clearancerc" };

    for (size_t idx=0; idx < sizeof(local_searchpaths)/sizeof(local_searchpaths[0]); idx++) {
      std::filesystem::path path{std::filesystem::path(home)/local_searchpaths[idx]};
      if (std::filesystem::exists(path, err)) {
        return path;
      }
    }
  }
  if (std::filesystem::exists(root/"etc/clearancerc", err)) {
    return root/"etc/clearancerc";
  }
  return "";
}

/* explicitly define destructor to avoid inlining warning */
parser::~parser(void) {
}

static bool
is_true(const std::string &s) {
  return s == "true" || s == "True" || s == "TRUE";
}

static bool
is_false(const std::string &s) {
  return s == "false" || s == "False" || s == "FALSE";
}

/**
 * Converts @p node to a Value. Plain scalars are typed as boolean,
 * integer or real where they parse as such; quoted scalars are always
 * strings. Maps cannot be represented.
 */
static bool
node_to_value(const YAML::Node &node, Value &v) {
  if (node.IsNull()) {
    v = Value();
    return true;
  }

  if (node.IsSequence()) {
    Value::List list;
    for (const auto &elem : node) {
      Value e;
      if (!node_to_value(elem, e))
        return false;
      list.push_back(std::move(e));
    }
    v = Value(std::move(list));
    return true;
  }

  if (!node.IsScalar())
    return false;

  const std::string &s = node.Scalar();
  if (node.Tag() == "!") {
    v = Value(s);
    return true;
  }

  if (is_true(s) || is_false(s)) {
    v = Value(is_true(s));
    return true;
  }

  if (!s.empty()) {
    char *end = nullptr;
    errno = 0;
    long long i = std::strtoll(s.c_str(), &end, 10);
    if (end && *end == '\0') {
      if (errno == ERANGE) {
        log(CLEARANCE_LOG_WARNING, "number out of range: %s\n", s.c_str());
        return false;
      }
      v = Value(i);
      return true;
    }

    errno = 0;
    double d = std::strtod(s.c_str(), &end);
    if (end && *end == '\0') {
      if (errno == ERANGE) {
        log(CLEARANCE_LOG_WARNING, "number out of range: %s\n", s.c_str());
        return false;
      }
      v = Value(d);
      return true;
    }
  }

  v = Value(s);
  return true;
}

/* Reads a scalar or a sequence of scalars into @p out. */
static bool
node_to_string_set(const YAML::Node &node, std::set<std::string> &out) {
  out.clear();
  if (node.IsScalar()) {
    out.insert(node.as<std::string>());
    return true;
  }
  if (!node.IsSequence())
    return false;

  for (const auto &elem : node) {
    if (!elem.IsScalar())
      return false;
    out.insert(elem.as<std::string>());
  }
  return true;
}

static bool
node_to_conditions(const YAML::Node &node, Conditions &conditions) {
  if (!node.IsMap())
    return false;

  for (const auto &entry : node) {
    const auto path = entry.first.as<std::string>();

    if (entry.second.IsMap()) {
      Condition::Operands operands;
      for (const auto &o : entry.second) {
        const auto name = o.first.as<std::string>();
        const auto op = parse_operator(name);
        Value operand;
        if (!op || !node_to_value(o.second, operand)) {
          log(CLEARANCE_LOG_WARNING, "condition %s: invalid operator %s\n",
              path.c_str(), name.c_str());
          return false;
        }
        operands.emplace_back(*op, std::move(operand));
      }
      conditions.push_back(Condition::where(path, std::move(operands)));
    } else {
      Value expected;
      if (!node_to_value(entry.second, expected)) {
        return false;
      }
      conditions.push_back(Condition::equals(path, std::move(expected)));
    }
  }
  return true;
}

static bool
node_to_policy_rule(const YAML::Node &node, PolicyRule &rule) {
  if (!node.IsMap())
    return false;

  auto id = node["id"];
  auto name = node["name"];
  auto effect = node["effect"];
  auto conditions = node["conditions"];
  auto actions = node["actions"];
  auto resources = node["resources"];
  auto priority = node["priority"];
  auto enabled = node["enabled"];

  if (!id.IsDefined() || !effect.IsDefined() || !actions.IsDefined()) {
    log(CLEARANCE_LOG_ERR, "policy requires id, effect and actions\n");
    return false;
  }

  rule.id = id.as<std::string>();
  rule.name = name.IsDefined() ? name.as<std::string>() : rule.id;

  const auto e = parse_effect(effect.as<std::string>());
  if (!e) {
    log(CLEARANCE_LOG_ERR, "policy %s: invalid effect\n", rule.id.c_str());
    return false;
  }
  rule.effect = *e;

  if (!node_to_string_set(actions, rule.actions)
      || (resources.IsDefined() && !node_to_string_set(resources, rule.resources))
      || (conditions.IsDefined() && !node_to_conditions(conditions, rule.conditions))) {
    log(CLEARANCE_LOG_ERR, "policy %s: invalid definition\n", rule.id.c_str());
    return false;
  }

  if (priority.IsDefined())
    rule.priority = priority.as<int>();
  if (enabled.IsDefined())
    rule.enabled = enabled.as<bool>();
  return true;
}

bool
parser::readLogLevel(void) {
  if (auto level = (*config_root)["log_level"]) {
    log_t l;
    if (!level.IsScalar() || !log_level_from_string(level.as<std::string>(), l)) {
      log(CLEARANCE_LOG_ERR, "invalid log_level\n");
      return false;
    }
    log_level = l;
  }
  return true;
}

void
parser::readDefaults(void) {
  if (auto defaults = (*config_root)["default_policies"]) {
    load_default_policies = defaults.as<bool>();
  }
}

bool
parser::readPolicyFiles(void) {
  if (auto files = (*config_root)["policy_files"]) {
    if (files.IsScalar()) {
      policy_files.push_back(files.as<std::string>());
    } else if (files.IsSequence()) {
      for (const auto &file : files) {
        policy_files.push_back(file.as<std::string>());
      }
    } else {
      return false;
    }

    for (auto &file : policy_files) {
      std::filesystem::path path{file};
      if (path.is_relative() && !base_dir.empty()) {
        file = base_dir/path;
      }
    }
  }
  return true;
}

bool
parser::readRoles(void) {
  if (auto roles = (*config_root)["roles"]) {
    if (!roles.IsSequence())
      return false;

    for (const auto &entry : roles) {
      auto name = entry["role"];
      auto grant = entry["grant"];
      std::set<std::string> permissions;
      if (!name.IsDefined() || !grant.IsDefined()
          || !node_to_string_set(grant, permissions)) {
        log(CLEARANCE_LOG_ERR, "roles: entries need role and grant\n");
        return false;
      }

      const Role role = parse_role(name.as<std::string>());
      if (role == Role::unknown) {
        log(CLEARANCE_LOG_ERR, "roles: unknown role %s\n",
            name.as<std::string>().c_str());
        return false;
      }

      for (const auto &p : permissions) {
        const Permission permission = parse_permission(p);
        if (permission == Permission::unknown) {
          log(CLEARANCE_LOG_ERR, "roles: unknown permission %s\n", p.c_str());
          return false;
        }
        grants.push_back({ role, permission });
      }
    }
  }
  return true;
}

bool
parser::readPolicies(void) {
  if (auto rules = (*config_root)["policies"]) {
    if (!rules.IsSequence())
      return false;

    for (const auto &entry : rules) {
      PolicyRule rule;
      if (!node_to_policy_rule(entry, rule)) {
        return false;
      }
      policies.push_back(std::move(rule));
    }
  }
  return true;
}

/* Forgets everything read by a previous parse. */
void
parser::clear(void) {
  config_root.reset();
  log_level.reset();
  load_default_policies = false;
  policy_files.clear();
  grants.clear();
  policies.clear();
}

bool
parser::load(YAML::Node node) {
  clear();
  config_root = std::make_unique<YAML::Node>(std::move(node));
  if (!config_root->IsMap()) {
    log(CLEARANCE_LOG_ERR, "configuration must be a map\n");
    clear();
    return false;
  }

  readDefaults();
  if (!readLogLevel() || !readPolicyFiles() || !readRoles() || !readPolicies()) {
    clear();
    return false;
  }
  return true;
}

bool parser::parse(std::istream& input) {
  try {
    base_dir.clear();
    return load(YAML::Load(input));
  }
  catch (const YAML::ParserException& ex) {
    std::cerr << ex.what() << std::endl;
  }
  catch (const YAML::Exception& ex) {
    std::cerr << ex.what() << std::endl;
  }
  clear();
  return false;
}

bool parser::parseFile(const std::string &filename) {
  try {
    base_dir = std::filesystem::path(filename).parent_path();
    return load(YAML::LoadFile(filename));
  }
  catch (const YAML::BadFile& ex) {
    std::cerr << ex.what() << std::endl;
  }
  catch (const YAML::ParserException& ex) {
    std::cerr << ex.what() << std::endl;
  }
  catch (const YAML::Exception& ex) {
    std::cerr << ex.what() << std::endl;
  }
  clear();
  return false;
}

result_t
parser::configure(RoleAuthority &authority, PolicyEngine &engine) const {
  if (log_level) {
    set_log_level(*log_level);
  }

  PolicyRules rules;
  if (load_default_policies) {
    rules = default_policies();
  }

  for (const auto &file : policy_files) {
    PolicyRules loaded;
    result_t res = load_policy_file(file, loaded);
    if (res != CLEARANCE_OK) {
      return res;
    }
    std::move(loaded.begin(), loaded.end(), std::back_inserter(rules));
  }

  rules.insert(rules.end(), policies.begin(), policies.end());

  for (const auto &g : grants) {
    if (!authority.grant(g.role, g.permission)) {
      log(CLEARANCE_LOG_ERR, "cannot grant %s to %s\n",
          to_string(g.permission), to_string(g.role));
      return CLEARANCE_ERROR_BAD_REQUEST;
    }
  }
  engine.replace_policies(std::move(rules));
  return CLEARANCE_OK;
}

} /* namespace config */
} /* namespace clearance */
