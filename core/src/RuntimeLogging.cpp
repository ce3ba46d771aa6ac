#include "mediarelay/RuntimeLogging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

namespace mediarelay {

namespace {

bool isBlank(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Trimmed and lower-cased value of an environment variable.
std::string foldedEnv(const char *name) {
    std::string v = envOverride(name);
    const auto first = std::find_if_not(v.begin(), v.end(), isBlank);
    const auto last = std::find_if_not(v.rbegin(), v.rend(), isBlank).base();
    if (first >= last)
        return {};
    std::string out(first, last);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return out;
}

bool oneOf(const std::string &v, std::initializer_list<const char *> words) {
    return std::any_of(words.begin(), words.end(),
                       [&v](const char *w) { return v == w; });
}

} // namespace

std::string envOverride(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    return (raw && *raw) ? std::string(raw) : std::string();
}

bool envFlagEnabled(const char *name) {
    return oneOf(foldedEnv(name), {"1", "true", "yes", "on"});
}

bool isDevEnvironment() {
    return oneOf(foldedEnv(kEnvironmentVar),
                 {"dev", "development", "local", "debug"});
}

bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled(kLogSensitiveVar);
}

std::string redacted(const std::string &value) {
    return sensitiveLoggingEnabled() ? value : std::string("-");
}

} // namespace mediarelay
