#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace lmgate {

std::string error_to_json(const Error& err) {
    return std::format(R"({{"error":{{"type":"{}","message":"{}"}}}})",
        error_category_to_string(err.category),
        utils::escape_json(err.message));
}

} // namespace lmgate
