#pragma once

#include "index/index_definition.h"
#include "storage/record.h"
#include "utils/status.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kvindex {

/// Order-preserving encoding of single field values into key fragments.
///
/// The store compares keys byte-wise; the fragment of a value must sort like
/// the value itself in the requested direction:
/// - string asc:  Codepoints rechts mit ' ' auf string_order_pad_length aufgefüllt
/// - string desc: jeder Codepoint c -> 0x10FFFF - c, Padding mit 0x10FFFF,
///                optional base32hex (Padding '=' -> ARMOR_PAD_CHAR)
/// - string unordered, bool: unverändert
/// - int64: 19 Stellen mit führenden Nullen; desc kodiert INT64_MAX - v
/// - double: asc unverändert, desc DBL_MAX - v (keine Padding-Strategie)
///
/// Known gaps, kept as documented behaviour:
/// - strings longer than the pad length no longer sort correctly
/// - negative integers sort wrong ascending and are rejected descending
/// - doubles only sort correctly within one exponent range; descending
///   doubles collapse to DBL_MAX for all but huge magnitudes
class KeyEncoder {
public:
    static constexpr int INT_KEY_WIDTH = 19;             // INT64_MAX = 9223372036854775807
    static constexpr char32_t MAX_CODEPOINT = 0x10FFFF;
    static constexpr char32_t MIN_PRINTABLE = 0x20;       // ' '
    static constexpr char ARMOR_PAD_CHAR = '-';           // sortiert vor '0'..'9','A'..'V'

    /// Fragment for the order part of an index key.
    /// UnsupportedEncoding for null values and negative descending integers.
    static std::pair<Status, std::string> encodeOrderValue(
        const Index& index,
        std::string_view field,
        const Value& value
    );

    /// Pad (asc) or reverse+pad (desc), optional base32hex armor
    static std::string encodeOrderedString(const Index& index, std::string_view value);

    /// UnsupportedEncoding for negative values with OrderType::DESCENDING
    static std::pair<Status, std::string> encodeInteger(int64_t value, OrderType order);

    static std::string encodeDouble(double value, OrderType order);

    /// RFC 4648 "base32hex" alphabet (0-9, A-V), order preserving
    static std::string base32HexEncode(std::string_view bytes);

    // UTF-8 helpers (invalid sequences decode to U+FFFD)
    static std::vector<char32_t> decodeUtf8(std::string_view s);
    static void appendUtf8(std::string& out, char32_t cp);
};

} // namespace kvindex
