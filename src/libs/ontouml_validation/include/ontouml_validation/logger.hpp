#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace ontouml_validation {

// Shared logger for the validation libraries ("ontouml_validation", stderr).
// Falls back to spdlog's default logger if the sink cannot be created.
std::shared_ptr<spdlog::logger> validation_logger();

} // namespace ontouml_validation
