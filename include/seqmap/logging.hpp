#ifndef SEQMAP_LOGGING_HPP
#define SEQMAP_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace seqmap {

/**
 * Returns the logger used by this library.
 *
 * The default logger is named "seqmap" and has no sinks, i.e. the library
 * is silent unless the application installs its own logger.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * Replaces the logger used by this library. Passing a null pointer
 * restores the default logger.
 */
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace seqmap

#endif // SEQMAP_LOGGING_HPP
