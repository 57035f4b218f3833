#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace borestitch {

/// Library-wide logger ("borestitch", stderr). Created on first use.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger (e.g. to route into an application sink).
void setLogger(std::shared_ptr<spdlog::logger> lg);

void setLogLevel(spdlog::level::level_enum level);

} // namespace borestitch
