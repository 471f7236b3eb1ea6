#include <seqmap/logging.hpp>

#include <mutex>

namespace seqmap {

static std::shared_ptr<spdlog::logger> make_default_logger() {
    return std::make_shared<spdlog::logger>("seqmap");
}

static std::mutex logger_mutex;
static std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex);
    if (!current_logger)
        current_logger = make_default_logger();
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lock(logger_mutex);
    current_logger = std::move(logger);
}

} // namespace seqmap
