/*
 * clearance_check.cc -- evaluate an access request against a policy set
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "clearance/clearance.hh"
#include "clearance/config_parser.hh"
#include "clearance/rules_json.hh"

enum {
  EXIT_ALLOW = 0,
  EXIT_DENY = 1,
  EXIT_BAD_INPUT = 2,
  EXIT_BAD_CONFIG = 3
};

static void
usage( const char *program, const char *version) {
  const char *p;

  p = strrchr(program, '/');
  if (p)
    program = ++p;

  fprintf( stderr, "%s v%s -- Clearance access check\n\n"
           "usage: %s [-C file] [-P file] [-d] [-l] [-v num] [request]\n\n"
           "\t-C file\t\tload configuration file\n"
           "\t-P file\t\tload additional policy set (JSON)\n"
           "\t-d\t\tinstall the built-in policies\n"
           "\t-l\t\tprint the active policy set and exit\n"
           "\t-v num\t\tverbosity level (default: 4)\n\n"
           "\trequest is a JSON file with the members user, resource,\n"
           "\taction and context; '-' or no argument reads stdin.\n",
    program, version, program );
}

static json_t *
read_request(const char *filename) {
  json_error_t error;
  json_t *j;

  if (!filename || strcmp(filename, "-") == 0) {
    j = json_loadf(stdin, 0, &error);
    filename = "<stdin>";
  } else {
    j = json_load_file(filename, 0, &error);
  }

  if (!j) {
    std::cerr << filename << ":" << error.line << ": " << error.text << std::endl;
  }
  return j;
}

int
main(int argc, char **argv) {
  int opt;
  bool list_only = false;
  bool defaults = false;
  std::vector<std::string> policy_files;
  clearance::config::parser parser;

  clearance::set_log_level(clearance::CLEARANCE_LOG_WARNING);

  while ((opt = getopt(argc, argv, "C:P:dlv:")) != -1) {
    switch (opt) {
    case 'C' :
      if (!parser.parseFile(optarg)) {
        std::cerr << "Invalid configuration!" << std::endl;
        exit(EXIT_BAD_CONFIG);
      }
      break;
    case 'P' :
      policy_files.push_back(optarg);
      break;
    case 'd' :
      defaults = true;
      break;
    case 'l' :
      list_only = true;
      break;
    case 'v' : {
      clearance::log_t level;
      if (!clearance::log_level_from_string(optarg, level)) {
        usage(argv[0], LIBCLEARANCE_PACKAGE_VERSION);
        exit(EXIT_BAD_INPUT);
      }
      clearance::set_log_level(level);
      break;
    }
    default:
      usage(argv[0], LIBCLEARANCE_PACKAGE_VERSION);
      exit(EXIT_BAD_INPUT);
    }
  }

  if (!parser.have_config()) {
    std::string filename = clearance::config::getDefaultConfigFile();
    if (!filename.empty() && !parser.parseFile(filename)) {
      std::cerr << "Invalid configuration in " << filename << std::endl;
      exit(EXIT_BAD_CONFIG);
    }
  }

  /* command line options take precedence over the config file */
  parser.load_default_policies |= defaults;
  parser.policy_files.insert(parser.policy_files.end(),
                             policy_files.begin(), policy_files.end());

  clearance::RoleAuthority authority;
  clearance::PolicyEngine engine{authority};

  clearance::result_t res = parser.configure(authority, engine);
  if (res != clearance::CLEARANCE_OK) {
    std::cerr << "Cannot load policies: " << clearance::result_name(res) << std::endl;
    exit(EXIT_BAD_CONFIG);
  }

  if (list_only) {
    clearance::json_ptr j = clearance::policy_set_to_json(engine.policies());
    json_dumpf(j.get(), stdout, JSON_INDENT(2));
    fputc('\n', stdout);
    return EXIT_SUCCESS;
  }

  clearance::json_ptr j{read_request(optind < argc ? argv[optind] : nullptr)};
  clearance::Request request;
  if (!j || clearance::json_to_request(j.get(), request) != clearance::CLEARANCE_OK) {
    std::cerr << "Invalid request!" << std::endl;
    exit(EXIT_BAD_INPUT);
  }

  const clearance::Decision decision =
    engine.decide(request.user, request.resource, request.action, request.context);

  std::cout << (decision.allowed ? "allow" : "deny");
  if (!decision.rule_id.empty()) {
    std::cout << " (" << decision.rule_id << ")";
  }
  std::cout << ": " << decision.reason << std::endl;

  return decision.allowed ? EXIT_ALLOW : EXIT_DENY;
}
