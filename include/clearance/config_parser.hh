/*
 * config_parser.hh -- YAML configuration of the Clearance library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#ifndef _CLEARANCE_CONFIG_PARSER_HH_
#define _CLEARANCE_CONFIG_PARSER_HH_ 1

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "clearance/clearance.hh"

namespace clearance {
namespace config {

/**
 * Returns the first existing file of $HOME/.clearancerc,
 * $HOME/.local/clearance/clearancerc and /etc/clearancerc, or an
 * empty string.
 */
std::string getDefaultConfigFile(void);

/** A permission granted to a role in addition to the built-in table. */
struct Grant {
  Role role;
  Permission permission;
};

/**
 * Reads a configuration like
 *
 *   log_level: info
 *   default_policies: true
 *   policy_files: [ policies.json ]
 *   roles:
 *     - role: auditor
 *       grant: [ analytics:export ]
 *   policies:
 *     - id: weekday-view
 *       effect: allow
 *       actions: [ claim:view ]
 *       conditions:
 *         context.day_of_week: { $lte: 4 }
 *
 * Relative policy file names are resolved against the directory of
 * the configuration file.
 */
class parser {
public:
  ~parser(void);

  /**
   * Reads a configuration. Results of an earlier parse are discarded,
   * also if parsing fails.
   */
  bool parse(std::istream& input);
  bool parseFile(const std::string &filename);

  bool have_config(void) const { return (bool)config_root; }

  /**
   * Grants the configured permissions in @p authority and installs
   * the configured rules in @p engine. The rule set of @p engine is
   * only replaced if all policy files could be read.
   *
   * @return CLEARANCE_OK on success, the error of the first policy
   *         file that failed to load otherwise.
   */
  result_t configure(RoleAuthority &authority, PolicyEngine &engine) const;

  std::optional<log_t> log_level;
  bool load_default_policies = false;
  std::vector<std::string> policy_files;
  std::vector<Grant> grants;
  PolicyRules policies;
protected:
  std::unique_ptr<YAML::Node> config_root;
  std::filesystem::path base_dir;

  void clear(void);
  bool load(YAML::Node node);
  bool readLogLevel(void);
  void readDefaults(void);
  bool readPolicyFiles(void);
  bool readRoles(void);
  bool readPolicies(void);
};

} /* namespace config */
} /* namespace clearance */

#endif /* _CLEARANCE_CONFIG_PARSER_HH_ */
