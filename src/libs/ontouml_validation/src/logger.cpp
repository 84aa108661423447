#include <ontouml_validation/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ontouml_validation {

std::shared_ptr<spdlog::logger> validation_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    logger = spdlog::get("ontouml_validation");
    if (logger) return logger;

    try {
        logger = spdlog::stderr_color_mt("ontouml_validation");
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace ontouml_validation
