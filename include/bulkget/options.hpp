#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bulkget {

enum class IpFamily { Any, V4, V6 };

struct HttpRequestOptions {
    std::string user_agent{"bulkget/1.0"};
    std::chrono::seconds connect_timeout{30};
    // Abort when throughput stays below 1 byte/s for this long.
    std::chrono::seconds low_speed_timeout{60};
    bool follow_redirects{true};
    IpFamily ip_family{IpFamily::Any};
    bool verify_tls{true};
};

enum class KnownHostsPolicy {
    Strict,    // host must already be present in known_hosts
    AcceptNew, // unknown hosts are accepted, changed keys are rejected
    Off
};

struct SshCredentials {
    std::optional<std::string> private_key;      // PEM key material
    std::optional<std::string> private_key_path;
    std::optional<std::string> passphrase;
    std::optional<std::string> password;
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy{KnownHostsPolicy::AcceptNew};
    std::chrono::seconds connect_timeout{30};
};

struct ProgressPolicy {
    std::chrono::milliseconds interval{500};
    std::size_t chunk_interval{10};
};

struct ProtocolOptions {
    HttpRequestOptions http;
    SshCredentials ssh;
    ProgressPolicy progress;
    // Resume even when neither the stored record nor the server carries a validator.
    bool resume_without_validators{true};
};

struct BatchOptions {
    bool enable_resume{true};
    std::size_t max_concurrent{3};
    bool output_to_stdout{false};
    bool quiet_mode{false};
    ProtocolOptions protocol;
    std::chrono::hours metadata_retention{7 * 24};

    // Throws TransferError (Validation) when a field is out of range.
    void validate() const;
};

} // namespace bulkget
