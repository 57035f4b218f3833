#include "borestitch/core/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace borestitch {

namespace {
std::mutex g_mtx;
std::shared_ptr<spdlog::logger> g_logger;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lk(g_mtx);
    if (!g_logger) {
        g_logger = spdlog::get("borestitch");
        if (!g_logger) g_logger = spdlog::stderr_color_mt("borestitch");
    }
    return g_logger;
}

void setLogger(std::shared_ptr<spdlog::logger> lg) {
    std::lock_guard<std::mutex> lk(g_mtx);
    g_logger = std::move(lg);
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace borestitch
