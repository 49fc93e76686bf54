#pragma once
#include <spdlog/spdlog.h>
#include <memory>
namespace peerdrop::logging {

/// Process-wide "peerdrop" logger on a colored stdout sink, created on first use.
std::shared_ptr<spdlog::logger> GetLogger();

void SetLevel(spdlog::level::level_enum level);

}
