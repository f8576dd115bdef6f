#include "core/utils.hpp"

namespace lmgate::utils {

std::optional<bool> parse_bool(std::string_view sv) {
    const std::string lower = to_lower(sv);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

namespace log {

std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

} // namespace log

} // namespace lmgate::utils
