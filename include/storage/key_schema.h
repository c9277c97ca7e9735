#pragma once

#include "index/index_definition.h"

#include <optional>
#include <string>
#include <string_view>

namespace kvindex {

/// Key schema for index entries on top of a flat ordered key space
///
///   <namespace>:<indexName>[:<filterValue>]:<encodedOrderValue>[:<id>]
///
/// indexName:  by<Field> (unordered), byOrdered<Field> (ascending),
///             byDescOrdered<Field> (descending); Field title-cased
/// filterValue only when filter and order field differ; the trailing id is
/// appended on writes and omitted for scan prefixes.
class KeySchema {
public:
    /// "byEmail", "byOrderedAge", "byDescOrderedCreated"
    static std::string makeIndexName(const Index& index);

    /// "<ns>:<indexName>:" - matches every entry of the index
    static std::string makeIndexPrefix(std::string_view ns, const Index& index);

    /// "<ns>:<indexName>:<filter>:" - all entries with one filter value
    static std::string makeFilterPrefix(std::string_view ns, const Index& index, std::string_view filterValue);

    /// Full key (with id) or exact-value scan prefix (id = nullopt, trailing ':')
    static std::string makeIndexKey(
        std::string_view ns,
        const Index& index,
        const std::optional<std::string>& filterValue,
        std::string_view encodedOrderValue,
        const std::optional<std::string>& id
    );

    /// Title-case like "created_at" -> "Created_at", "first name" -> "First Name"
    static std::string titleCase(std::string_view field);

    /// ':' -> ";\x01", ';' -> ";\x02". Keeps byte order and never emits ':',
    /// so a component can't split a key or end early in a scan prefix
    static std::string encodeKeyComponent(std::string_view raw);

    static constexpr char SEPARATOR = ':';
    static constexpr char ESCAPE = ';';
};

} // namespace kvindex
