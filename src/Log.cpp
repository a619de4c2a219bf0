/**
 * @file Log.cpp
 * @brief Logger construction
 */

#include "ontodiff/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace ontodiff {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance;
    static std::once_flag once;

    std::call_once(once, [] {
        try {
            instance = spdlog::get("ontodiff");
            if (!instance) {
                instance = spdlog::stderr_color_mt("ontodiff");
            }
            instance->set_level(spdlog::level::warn);
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        } catch (const spdlog::spdlog_ex&) {
            instance = spdlog::default_logger();
        }
    });
    return instance;
}

bool set_log_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(lvl);
    return true;
}

} // namespace ontodiff
