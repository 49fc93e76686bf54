#include "peerdrop/logging/logger.hpp"
#include "peerdrop/core/constants.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>
namespace peerdrop::logging {

namespace {
    std::once_flag logger_once;
    std::shared_ptr<spdlog::logger> logger_instance;
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::call_once(logger_once, []() {
        const std::string name(protocol::kLoggerName);
        logger_instance = spdlog::get(name);
        if (!logger_instance) {
            logger_instance = spdlog::stdout_color_mt(name);
            logger_instance->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
            logger_instance->set_level(spdlog::level::info);
        }
    });
    return logger_instance;
}

void SetLevel(const spdlog::level::level_enum level) {
    GetLogger()->set_level(level);
}

}
