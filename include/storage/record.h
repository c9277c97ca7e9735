#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kvindex {

/// Closed set of field values that can take part in an index
using Value = std::variant<
    std::monostate,           // null
    bool,                     // boolean
    int64_t,                  // integer
    double,                   // floating point
    std::string               // string
>;

/// "null", "bool", "int64", "double" or "string"
const char* valueTypeName(const Value& v);

/// Plain textual form (strings verbatim, numbers in decimal, true/false, null)
std::string valueToString(const Value& v);

/// JSON scalar -> Value; nullopt for arrays and objects
std::optional<Value> valueFromJson(const nlohmann::json& j);

nlohmann::json valueToJson(const Value& v);

/// Record: one application object, serialized once into an ordered field map.
///
/// - Storage format: JSON text (the blob stored under every index key)
/// - Top-level scalar fields are decoded into Value; nested arrays/objects are
///   remembered by type name only so index encoding can reject them explicitly
class Record {
public:
    using Blob = std::vector<uint8_t>;
    using FieldMap = std::map<std::string, Value, std::less<>>;

    Record() = default;

    /// Throws std::invalid_argument if doc is not a JSON object
    static Record fromJson(nlohmann::json doc);

    /// Parse a stored blob; throws nlohmann::json::parse_error or std::invalid_argument
    static Record deserialize(const Blob& blob);

    /// Serialize to the stored blob (compact JSON)
    Blob serialize() const;

    const nlohmann::json& json() const { return doc_; }

    bool hasField(std::string_view field_name) const;

    /// Scalar field value; nullopt if the field is missing or not a scalar
    std::optional<Value> getField(std::string_view field_name) const;

    /// Type name for diagnostics: a Value type name, "array", "object" or "missing"
    std::string fieldTypeName(std::string_view field_name) const;

    const FieldMap& fields() const { return fields_; }

private:
    nlohmann::json doc_ = nlohmann::json::object();
    FieldMap fields_;
    std::map<std::string, std::string, std::less<>> nested_;   // field -> "array"/"object"

    void buildFieldMap();
};

} // namespace kvindex
