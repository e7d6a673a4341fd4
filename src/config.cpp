#include "bulkget/config.hpp"
#include "bulkget/error.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace bulkget {

namespace {

using nlohmann::json;

TransferError configError(const std::string& key, const std::string& expected) {
    return TransferError(ErrorKind::Configuration, fmt::format("Config key '{}' must be {}", key, expected));
}

const json* member(const json& section, const char* key) {
    const auto it = section.find(key);
    return it == section.end() || it->is_null() ? nullptr : &*it;
}

bool readBool(const json& section, const char* key, const std::string& path, bool current) {
    const json* value = member(section, key);
    if (!value) {
        return current;
    }
    if (!value->is_boolean()) {
        throw configError(path, "a boolean");
    }
    return value->get<bool>();
}

std::int64_t readPositive(const json& section, const char* key, const std::string& path, std::int64_t current) {
    const json* value = member(section, key);
    if (!value) {
        return current;
    }
    if (!value->is_number_integer() || value->get<std::int64_t>() < 1) {
        throw configError(path, "a positive integer");
    }
    return value->get<std::int64_t>();
}

std::optional<std::string> readString(const json& section, const char* key, const std::string& path) {
    const json* value = member(section, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw configError(path, "a string");
    }
    return value->get<std::string>();
}

const json* readSection(const json& root, const char* name) {
    const json* section = member(root, name);
    if (section && !section->is_object()) {
        throw configError(name, "an object");
    }
    return section;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<bool> parseBoolText(const std::string& text) {
    const std::string value = lowercase(text);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

} // namespace

std::optional<KnownHostsPolicy> ConfigLoader::parseKnownHostsPolicy(const std::string& text) {
    const std::string value = lowercase(text);
    if (value == "strict") {
        return KnownHostsPolicy::Strict;
    }
    if (value == "accept-new") {
        return KnownHostsPolicy::AcceptNew;
    }
    if (value == "off") {
        return KnownHostsPolicy::Off;
    }
    return std::nullopt;
}

AppConfig ConfigLoader::parseJsonString(const std::string& text, AppConfig base) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw TransferError(ErrorKind::Configuration, fmt::format("Config is not valid JSON: {}", ex.what()));
    }
    if (!root.is_object()) {
        throw TransferError(ErrorKind::Configuration, "Config must be a JSON object");
    }

    AppConfig config = std::move(base);
    BatchOptions& options = config.options;

    if (const json* downloads = readSection(root, "downloads")) {
        options.max_concurrent = static_cast<std::size_t>(
            readPositive(*downloads, "maxConcurrent", "downloads.maxConcurrent",
                         static_cast<std::int64_t>(options.max_concurrent)));
        options.enable_resume = readBool(*downloads, "enableResume", "downloads.enableResume", options.enable_resume);
        options.protocol.progress.interval = std::chrono::milliseconds(
            readPositive(*downloads, "progressIntervalMs", "downloads.progressIntervalMs",
                         options.protocol.progress.interval.count()));
        options.protocol.progress.chunk_interval = static_cast<std::size_t>(
            readPositive(*downloads, "progressChunkInterval", "downloads.progressChunkInterval",
                         static_cast<std::int64_t>(options.protocol.progress.chunk_interval)));
        options.protocol.resume_without_validators =
            readBool(*downloads, "resumeWithoutValidators", "downloads.resumeWithoutValidators",
                     options.protocol.resume_without_validators);
        options.metadata_retention = std::chrono::hours(
            24 * readPositive(*downloads, "metadataRetentionDays", "downloads.metadataRetentionDays",
                              options.metadata_retention.count() / 24));
    }

    if (const json* http = readSection(root, "http")) {
        auto& h = options.protocol.http;
        if (auto agent = readString(*http, "userAgent", "http.userAgent")) {
            h.user_agent = *agent;
        }
        h.connect_timeout = std::chrono::seconds(
            readPositive(*http, "connectTimeoutSec", "http.connectTimeoutSec", h.connect_timeout.count()));
        h.low_speed_timeout = std::chrono::seconds(
            readPositive(*http, "lowSpeedTimeoutSec", "http.lowSpeedTimeoutSec", h.low_speed_timeout.count()));
        h.follow_redirects = readBool(*http, "followRedirects", "http.followRedirects", h.follow_redirects);
        h.verify_tls = readBool(*http, "verifyTls", "http.verifyTls", h.verify_tls);
        if (auto family = readString(*http, "ipFamily", "http.ipFamily")) {
            const std::string value = lowercase(*family);
            if (value == "any") {
                h.ip_family = IpFamily::Any;
            } else if (value == "ipv4") {
                h.ip_family = IpFamily::V4;
            } else if (value == "ipv6") {
                h.ip_family = IpFamily::V6;
            } else {
                throw configError("http.ipFamily", "one of \"any\", \"ipv4\", \"ipv6\"");
            }
        }
    }

    if (const json* ssh = readSection(root, "ssh")) {
        auto& s = options.protocol.ssh;
        if (auto key = readString(*ssh, "privateKeyPath", "ssh.privateKeyPath")) {
            s.private_key_path = *key;
        }
        if (auto known = readString(*ssh, "knownHostsPath", "ssh.knownHostsPath")) {
            s.known_hosts_path = *known;
        }
        if (auto policy = readString(*ssh, "knownHostsPolicy", "ssh.knownHostsPolicy")) {
            const auto parsed = parseKnownHostsPolicy(*policy);
            if (!parsed) {
                throw configError("ssh.knownHostsPolicy", "one of \"strict\", \"accept-new\", \"off\"");
            }
            s.known_hosts_policy = *parsed;
        }
    }

    if (const json* logging = readSection(root, "logging")) {
        if (auto level = readString(*logging, "level", "logging.level")) {
            config.log_level = *level;
        }
    }
    return config;
}

AppConfig ConfigLoader::parseJsonFile(const std::filesystem::path& path, AppConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw TransferError(ErrorKind::Configuration, fmt::format("Cannot open config file '{}'", path.string()));
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parseJsonString(text, std::move(base));
}

void ConfigLoader::applyEnvironment(AppConfig& config, const EnvLookup& lookup) {
    if (const auto value = lookup("BULKGET_MAX_CONCURRENT")) {
        try {
            const long parsed = std::stol(*value);
            if (parsed < 1) {
                throw configError("BULKGET_MAX_CONCURRENT", "a positive integer");
            }
            config.options.max_concurrent = static_cast<std::size_t>(parsed);
        } catch (const std::logic_error&) {
            throw configError("BULKGET_MAX_CONCURRENT", "a positive integer");
        }
    }
    if (const auto value = lookup("BULKGET_ENABLE_RESUME")) {
        const auto parsed = parseBoolText(*value);
        if (!parsed) {
            throw configError("BULKGET_ENABLE_RESUME", "a boolean");
        }
        config.options.enable_resume = *parsed;
    }
    if (const auto value = lookup("BULKGET_LOG_LEVEL")) {
        config.log_level = *value;
    }

    auto& ssh = config.options.protocol.ssh;
    if (const auto value = lookup("BULKGET_SSH_PASSWORD")) {
        ssh.password = *value;
    }
    if (const auto value = lookup("BULKGET_SSH_KEY")) {
        ssh.private_key_path = *value;
    }
    if (const auto value = lookup("BULKGET_SSH_PASSPHRASE")) {
        ssh.passphrase = *value;
    }
}

ConfigLoader::EnvLookup ConfigLoader::processEnvironment() {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

} // namespace bulkget
