#include "httpdiff/json.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace httpdiff {

void to_json(Json& j, const Value& value) {
    std::visit([&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            j = nullptr;
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const Array>>) {
            j = Json::array();
            for (const auto& element : *v) {
                j.push_back(Json(element));
            }
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const Tree>>) {
            j = Json::object();
            for (const auto& [key, element] : *v) {
                j[key] = Json(element);
            }
        } else {
            // bool, int64_t, double, std::string
            j = v;
        }
    }, value.storage());
}

void from_json(const Json& j, Value& value) {
    switch (j.type()) {
        case Json::value_t::null:
            value = Value{};
            break;
        case Json::value_t::boolean:
            value = j.get<bool>();
            break;
        case Json::value_t::number_integer:
            value = j.get<int64_t>();
            break;
        case Json::value_t::number_unsigned:
            value = j.get<uint64_t>();
            break;
        case Json::value_t::number_float:
            value = j.get<double>();
            break;
        case Json::value_t::string:
            value = j.get<std::string>();
            break;
        case Json::value_t::array: {
            Array elements;
            elements.reserve(j.size());
            for (const auto& element : j) {
                elements.push_back(element.get<Value>());
            }
            value = Value(std::move(elements));
            break;
        }
        case Json::value_t::object: {
            std::vector<Tree::Entry> entries;
            entries.reserve(j.size());
            for (const auto& [key, element] : j.items()) {
                entries.emplace_back(key, element.get<Value>());
            }
            value = Value(Tree(std::move(entries)));
            break;
        }
        default:
            throw std::invalid_argument(
                fmt::format("unsupported JSON value type '{}'", j.type_name()));
    }
}

std::optional<Value> parse_json(std::string_view text) {
    Json j = Json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    return j.get<Value>();
}

bool load_json_file(const std::string& path, Value& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = fmt::format("cannot read '{}': {}", path, std::strerror(errno));
        return false;
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        error = fmt::format("cannot read '{}': {}", path, std::strerror(errno));
        return false;
    }

    auto decoded = parse_json(contents.str());
    if (!decoded) {
        error = fmt::format("could not decode '{}'", path);
        return false;
    }

    out = std::move(*decoded);
    return true;
}

std::string to_display_string(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:
            return "null";
        case ValueKind::Bool:
            return value.as_bool() ? "true" : "false";
        case ValueKind::Integer:
        case ValueKind::Float:
            // JSON number text, so 1.0 keeps its fraction
            return Json(value).dump();
        case ValueKind::String:
            return value.as_string();
        case ValueKind::Array:
        case ValueKind::Tree:
            return Json(value).dump(JSON_INDENT);
    }
    return "";
}

} // namespace httpdiff
