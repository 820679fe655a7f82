/**
 * @file logging.hpp
 * @brief Access to the engine's spdlog logger.
 */
#pragma once
#include "actiondag/common/common.hpp"

#include <spdlog/spdlog.h>

namespace actiondag
{

/**
 * @brief Name under which the engine logger is registered with spdlog.
 */
inline constexpr const char* kLoggerName = "actiondag";

/**
 * @brief Get the engine logger.
 *
 * @details
 * If the application registered a logger named `kLoggerName` before the first
 * call, that logger is used. Otherwise a colour stdout logger is created.
 *
 * @par Thread safety
 * - Safe to call from any thread.
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Set the verbosity of the engine logger.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace actiondag
