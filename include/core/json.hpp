#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace lmgate {

/**
 * @brief Thin wrapper around glz::json_t
 *
 * Stores json_t by value. Const operator[] returns copies. Used to inspect
 * inbound chat-completion payloads and backend JSON bodies; mutation goes
 * through raw().
 */
class JsonValue {
public:
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        const double d = data_.get<double>();
        return d == std::floor(d) && std::isfinite(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] size_t size() const {
        if (data_.is_array()) return data_.get_array().size();
        if (data_.is_object()) return data_.get_object().size();
        return 0;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    // node.value("key", default): default when missing or of a different type
    template <typename T>
    [[nodiscard]] T value(std::string_view key, T default_value) const {
        const JsonValue node = (*this)[key];
        if constexpr (std::is_same_v<T, std::string>) {
            return node.is_string() ? node.get<std::string>() : default_value;
        } else if constexpr (std::is_same_v<T, bool>) {
            return node.is_boolean() ? node.get<bool>() : default_value;
        } else {
            return node.is_number() ? node.get<T>() : default_value;
        }
    }

    // ===== Parse / Serialize =====

    [[nodiscard]] static JsonValue parse(const std::string& json_str) {
        glz::json_t result;
        const auto ec = glz::read_json(result, json_str);
        if (ec) {
            throw parse_error(std::format("JSON parse error: {}",
                glz::format_error(ec, json_str)));
        }
        return JsonValue(std::move(result));
    }

    [[nodiscard]] std::string dump() const {
        std::string out;
        const auto ec = glz::write_json(data_, out);
        if (ec) {
            throw std::runtime_error("JSON serialization failed");
        }
        return out;
    }

    // ===== Raw Access =====

    [[nodiscard]] glz::json_t& raw() { return data_; }
    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

// ============================================================================
// Raw object members
// ============================================================================

/// Top-level members of a JSON object, each value kept as its source text
using RawMembers = std::map<std::string, glz::raw_json>;

/**
 * @brief Split a JSON object into its members without converting values.
 *
 * Numbers keep every digit; json_t would round integers above 2^53.
 */
[[nodiscard]] inline RawMembers parse_raw_members(const std::string& json_str) {
    RawMembers members;
    const auto ec = glz::read_json(members, json_str);
    if (ec) {
        throw JsonValue::parse_error(std::format("JSON parse error: {}",
            glz::format_error(ec, json_str)));
    }
    return members;
}

[[nodiscard]] inline std::string dump_raw_members(const RawMembers& members) {
    std::string out;
    const auto ec = glz::write_json(members, out);
    if (ec) {
        throw std::runtime_error("JSON serialization failed");
    }
    return out;
}

[[nodiscard]] inline glz::raw_json raw_member(std::string text) {
    glz::raw_json raw;
    raw.str = std::move(text);
    return raw;
}

} // namespace lmgate
