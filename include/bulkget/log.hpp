#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace bulkget {

// Shared "bulkget" logger. Writes to stderr so stdout stays free for file data.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("trace" .. "off"); unknown names leave the level unchanged.
bool setLogLevel(const std::string& level);

} // namespace bulkget
