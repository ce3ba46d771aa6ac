// Environment switches for diagnostics and for redacting locators, ids and
// host names in logs.
#pragma once
#include <string>

namespace mediarelay {

constexpr const char *kEnvironmentVar = "MEDIA_RELAY_ENV";
constexpr const char *kLogSensitiveVar = "MEDIA_RELAY_LOG_SENSITIVE";
constexpr const char *kTempDirVar = "MEDIA_RELAY_TEMP_DIR";

// Raw value, empty when unset. Case and whitespace are kept.
std::string envOverride(const char *name);
// True for 1/true/yes/on, ignoring case and surrounding blanks.
bool envFlagEnabled(const char *name);
// MEDIA_RELAY_ENV is dev, development, local or debug.
bool isDevEnvironment();
// Dev environment and MEDIA_RELAY_LOG_SENSITIVE set.
bool sensitiveLoggingEnabled();

// value itself when sensitive logging is enabled, "-" otherwise.
std::string redacted(const std::string &value);

} // namespace mediarelay
