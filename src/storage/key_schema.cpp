#include "storage/key_schema.h"
#include <cctype>

namespace kvindex {

std::string KeySchema::titleCase(std::string_view field) {
    std::string out(field);
    bool atWordStart = true;
    for (auto& ch : out) {
        const unsigned char c = static_cast<unsigned char>(ch);
        // Buchstaben, Ziffern, '_' und Nicht-ASCII gehören zum Wort
        const bool wordChar = std::isalnum(c) || c == '_' || c >= 0x80;
        if (atWordStart && std::islower(c)) {
            ch = static_cast<char>(std::toupper(c));
        }
        atWordStart = !wordChar;
    }
    return out;
}

std::string KeySchema::makeIndexName(const Index& index) {
    std::string name = "by";
    if (index.order.type != OrderType::UNORDERED) {
        if (index.order.type == OrderType::DESCENDING) name += "Desc";
        name += "Ordered";
    }
    name += titleCase(index.field_name);
    return name;
}

std::string KeySchema::makeIndexPrefix(std::string_view ns, const Index& index) {
    std::string key(ns);
    key += SEPARATOR;
    key += makeIndexName(index);
    key += SEPARATOR;
    return key;
}

std::string KeySchema::makeFilterPrefix(std::string_view ns, const Index& index, std::string_view filterValue) {
    std::string key = makeIndexPrefix(ns, index);
    key += encodeKeyComponent(filterValue);
    key += SEPARATOR;
    return key;
}

std::string KeySchema::makeIndexKey(
    std::string_view ns,
    const Index& index,
    const std::optional<std::string>& filterValue,
    std::string_view encodedOrderValue,
    const std::optional<std::string>& id
) {
    std::string key = filterValue ? makeFilterPrefix(ns, index, *filterValue) : makeIndexPrefix(ns, index);
    key += encodeKeyComponent(encodedOrderValue);
    key += SEPARATOR;
    if (id) {
        key += encodeKeyComponent(*id);
    }
    return key;
}

std::string KeySchema::encodeKeyComponent(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == SEPARATOR || c == ESCAPE) {
            // ':' (0x3A) und ';' (0x3B) liegen direkt nebeneinander
            out.push_back(ESCAPE);
            out.push_back(c == SEPARATOR ? '\x01' : '\x02');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace kvindex
