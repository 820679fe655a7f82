#include "actiondag/common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace actiondag
{

std::shared_ptr<spdlog::logger> get_logger()
{
    static const std::shared_ptr<spdlog::logger> logger = []() {
        auto existing = spdlog::get(kLoggerName);
        if (existing)
        {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        return created;
    }();
    return logger;
}

void set_log_level(spdlog::level::level_enum level)
{
    get_logger()->set_level(level);
}

} // namespace actiondag
