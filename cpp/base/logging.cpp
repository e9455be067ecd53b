#include "logging.hpp"
#include "exception.hpp"

#include <algorithm>
#include <cctype>

namespace base {

spdlog::level::level_enum str_to_log_level(const std::string& level)
{
    auto final_string = level;
    std::ranges::transform(final_string, final_string.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (final_string == "DEBUG") {
        return spdlog::level::debug;
    }
    if (final_string == "INFO") {
        return spdlog::level::info;
    }
    if (final_string == "WARN" || final_string == "WARNING") {
        return spdlog::level::warn;
    }
    if (final_string == "ERROR") {
        return spdlog::level::err;
    }

    throw unknown_log_level(level);
}

void configure_logging(const std::string& level)
{
    spdlog::set_level(str_to_log_level(level));
    spdlog::set_pattern("%l: %v");
}

} // namespace base
