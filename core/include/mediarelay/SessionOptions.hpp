// SSH endpoint settings shared by the SFTP source and sink backends.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace mediarelay {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact known_hosts match.
    AcceptNew, // TOFU: store unknown hosts, reject changed keys.
    Off        // No verification (not recommended).
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Confirmation for AcceptNew when the host is unknown. Without a
    // callback unknown hosts are accepted (the daemon has no one to ask).
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;

    // Base directory on the server; locators and uploads are relative to it.
    std::string remote_root = "/";

    // Bound on every blocking libssh2 call, handshake included. 0 waits
    // forever.
    long io_timeout_ms = 60000;
};

bool parseKnownHostsPolicy(const std::string &text, KnownHostsPolicy &out);
const char *knownHostsPolicyName(KnownHostsPolicy p);

} // namespace mediarelay
