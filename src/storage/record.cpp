#include "storage/record.h"
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

namespace kvindex {

const char* valueTypeName(const Value& v) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "int64";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else {
            return "string";
        }
    }, v);
}

std::string valueToString(const Value& v) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            // kürzeste Darstellung, die exakt zurückgelesen werden kann
            return fmt::format("{}", arg);
        } else {
            return arg;
        }
    }, v);
}

std::optional<Value> valueFromJson(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value{std::monostate{}};
        case nlohmann::json::value_t::boolean:
            return Value{j.get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return Value{j.get<int64_t>()};
        case nlohmann::json::value_t::number_unsigned: {
            const uint64_t u = j.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value{static_cast<int64_t>(u)};
            }
            // außerhalb von int64: wie jede andere nicht-ganzzahlige Zahl behandeln
            return Value{static_cast<double>(u)};
        }
        case nlohmann::json::value_t::number_float:
            return Value{j.get<double>()};
        case nlohmann::json::value_t::string:
            return Value{j.get<std::string>()};
        default:
            return std::nullopt;
    }
}

nlohmann::json valueToJson(const Value& v) {
    return std::visit([](auto&& arg) -> nlohmann::json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return arg;
        }
    }, v);
}

// ===== Record =====

Record Record::fromJson(nlohmann::json doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument(std::string("record must serialize to a JSON object, got ") + doc.type_name());
    }
    Record rec;
    rec.doc_ = std::move(doc);
    rec.buildFieldMap();
    return rec;
}

Record Record::deserialize(const Blob& blob) {
    return fromJson(nlohmann::json::parse(blob.begin(), blob.end()));
}

Record::Blob Record::serialize() const {
    const std::string s = doc_.dump();
    return Blob(s.begin(), s.end());
}

void Record::buildFieldMap() {
    fields_.clear();
    nested_.clear();
    for (auto it = doc_.begin(); it != doc_.end(); ++it) {
        auto v = valueFromJson(it.value());
        if (v) {
            fields_.emplace(it.key(), std::move(*v));
        } else {
            nested_.emplace(it.key(), it.value().type_name());
        }
    }
}

bool Record::hasField(std::string_view field_name) const {
    return fields_.find(field_name) != fields_.end() || nested_.find(field_name) != nested_.end();
}

std::optional<Value> Record::getField(std::string_view field_name) const {
    auto it = fields_.find(field_name);
    if (it == fields_.end()) return std::nullopt;
    return it->second;
}

std::string Record::fieldTypeName(std::string_view field_name) const {
    auto it = fields_.find(field_name);
    if (it != fields_.end()) return valueTypeName(it->second);
    auto nt = nested_.find(field_name);
    if (nt != nested_.end()) return nt->second;
    return "missing";
}

} // namespace kvindex
