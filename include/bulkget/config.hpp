#pragma once

#include "options.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace bulkget {

struct AppConfig {
    BatchOptions options;
    std::string log_level{"info"};
};

// JSON config file plus BULKGET_* environment overrides. Unknown keys are
// ignored; a known key with the wrong type or value throws TransferError
// (Configuration) naming the key.
class ConfigLoader {
public:
    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    static AppConfig parseJsonString(const std::string& text, AppConfig base = {});
    static AppConfig parseJsonFile(const std::filesystem::path& path, AppConfig base = {});

    static void applyEnvironment(AppConfig& config, const EnvLookup& lookup);
    [[nodiscard]] static EnvLookup processEnvironment();

    // "strict", "accept-new", "off"
    [[nodiscard]] static std::optional<KnownHostsPolicy> parseKnownHostsPolicy(const std::string& text);
};

} // namespace bulkget
