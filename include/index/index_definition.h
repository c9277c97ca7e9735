#pragma once

#include "storage/record.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvindex {

enum class OrderType {
    UNORDERED,   // nur Gleichheit (Identität), Werte unverändert im Key
    ASCENDING,
    DESCENDING
};

enum class IndexType {
    EQUALITY
};

const char* orderTypeToString(OrderType t);            // "unordered" | "ascending" | "descending"
std::optional<OrderType> orderTypeFromString(std::string_view s);
const char* indexTypeToString(IndexType t);            // "eq"

struct Query;

struct Order {
    /// Feld, nach dem sortiert wird; leer = gleich dem Filterfeld
    std::string field_name;
    OrderType type = OrderType::ASCENDING;
};

/// Deklaration eines Index über ein Feld des Records
struct Index {
    std::string field_name;
    IndexType type = IndexType::EQUALITY;
    Order order;
    // Keine doppelten Werte dieses Feldes (E-Mail, Username, Slug, ...)
    bool unique = false;
    // Sortierte Strings werden auf diese Länge (in Codepoints) aufgefüllt.
    // Muss größer als die längste erwartete Zeichenkette sein.
    int string_order_pad_length = 16;
    // Absteigende Strings zusätzlich base32hex-kodieren (lesbare Keys)
    bool base32_encode = false;

    /// Gleichheitsindex auf field_name, aufsteigend sortiert, Pad-Länge 16
    static Index byEquality(std::string field_name);

    /// Query, die exakt diesen Index trifft; ohne Wert = alle Einträge
    Query toQuery(std::optional<Value> value = std::nullopt) const;

    /// Sortierfeld (order.field_name oder, falls leer, field_name)
    const std::string& orderFieldName() const;

    /// true wenn nach einem anderen Feld sortiert als gefiltert wird
    bool hasSeparateOrderField() const;
};

/// Was der Aufrufer sucht; muss strukturell zu genau einem Index passen
struct Query {
    std::string field_name;
    IndexType type = IndexType::EQUALITY;
    Order order;
    std::optional<Value> value;   // nullopt: alle Einträge des Index listen
    int64_t offset = 0;
    int64_t limit = 0;            // 0 = unbegrenzt

    /// Gleichheits-Query auf field_name (aufsteigend)
    static Query equals(std::string field_name, Value value);

    /// Alle Einträge eines Feld-Index in der angegebenen Reihenfolge
    static Query all(std::string field_name, OrderType order = OrderType::ASCENDING);

    Query& withOffset(int64_t n) { offset = n; return *this; }
    Query& withLimit(int64_t n) { limit = n; return *this; }
};

/// (field_name, type, order.type) identisch
bool indexMatchesQuery(const Index& index, const Query& query);
bool indexesMatch(const Index& a, const Index& b);

/// Erster passender Index in Deklarationsreihenfolge, nullptr wenn keiner passt
const Index* findMatchingIndex(const std::vector<Index>& indexes, const Query& query);

/// "field=email type=eq order=ascending" für Fehlermeldungen und Logs
std::string describeQuery(const Query& query);

} // namespace kvindex
