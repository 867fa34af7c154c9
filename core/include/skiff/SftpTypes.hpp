// Basic types shared between the remote backends and the transfer engine.
// Keep these structures plain so both sides can copy them freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skiff {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: accept and store new hosts; reject key changes.
    Off         // No verification.
};

// Stage at which a connect attempt gave up.
enum class ConnectFailure {
    None,
    Network,        // DNS, TCP or SSH handshake
    HostKey,        // known_hosts unreadable, unknown host or key mismatch
    Authentication, // no method accepted
    Protocol        // SFTP subsystem could not be started
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    bool          is_symlink = false;
    std::uint64_t size  = 0;  // bytes
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // Identity files tried after the agent when no explicit key is given.
    std::vector<std::string> default_identities;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Returns true to accept and store, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;
};

} // namespace skiff
