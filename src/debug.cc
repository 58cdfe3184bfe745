/*
 * debug.cc -- logging facility for the Clearance library
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include "clearance/debug.hh"

namespace clearance {

static std::atomic<log_t> maxlog{CLEARANCE_LOG_WARNING};
static std::atomic<log_handler_t> log_handler{nullptr};

/* serializes writes of the default handler */
static std::mutex output_lock;

static const char *loglevels[] = {
  "EMRG", "ALRT", "CRIT", "ERR ", "WARN", "NOTE", "INFO", "DEBG"
};

static const char *levelnames[] = {
  "emerg", "alert", "crit", "err", "warning", "notice", "info", "debug"
};

log_t
get_log_level(void) {
  return maxlog;
}

void
set_log_level(log_t level) {
  maxlog = level;
}

bool
log_level_from_string(const std::string &s, log_t &level) {
  for (size_t idx = 0; idx < sizeof(levelnames)/sizeof(levelnames[0]); idx++) {
    if (s == levelnames[idx] || s == loglevels[idx]) {
      level = static_cast<log_t>(idx);
      return true;
    }
  }
  if (s == "error") {
    level = CLEARANCE_LOG_ERR;
    return true;
  }

  char *end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (!s.empty() && end && *end == '\0'
      && n >= CLEARANCE_LOG_EMERG && n <= CLEARANCE_LOG_DEBUG) {
    level = static_cast<log_t>(n);
    return true;
  }
  return false;
}

void
set_log_handler(log_handler_t handler) {
  log_handler = handler;
}

static size_t
print_timestamp(char *s, size_t len) {
  struct tm tmp;
  time_t now = time(nullptr);
  return strftime(s, len, "%b %d %H:%M:%S", localtime_r(&now, &tmp));
}

void
log(log_t level, const char *format, ...) {
  if (maxlog < level)
    return;

  char message[512];
  va_list ap;
  va_start(ap, format);
  vsnprintf(message, sizeof(message), format, ap);
  va_end(ap);

  log_handler_t handler = log_handler;
  if (handler) {
    handler(level, message);
    return;
  }

  char timebuf[32];
  if (print_timestamp(timebuf, sizeof(timebuf)) == 0) {
    timebuf[0] = '\0';
  }

  const char *name =
    level <= CLEARANCE_LOG_DEBUG ? loglevels[level] : loglevels[CLEARANCE_LOG_DEBUG];

  std::lock_guard<std::mutex> guard(output_lock);
  fprintf(stderr, "%s %s %s", timebuf, name, message);
  fflush(stderr);
}

} /* namespace clearance */
