#include "bulkget/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace bulkget {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] {
        instance = spdlog::get("bulkget");
        if (!instance) {
            instance = spdlog::stderr_color_mt("bulkget");
        }
        instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        instance->set_level(spdlog::level::info);
    });
    return instance;
}

bool setLogLevel(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace bulkget
