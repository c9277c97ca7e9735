#include "index/index_definition.h"

#include <utility>

namespace kvindex {

const char* orderTypeToString(OrderType t) {
    switch (t) {
        case OrderType::UNORDERED: return "unordered";
        case OrderType::ASCENDING: return "ascending";
        case OrderType::DESCENDING: return "descending";
        default: return "ascending";
    }
}

std::optional<OrderType> orderTypeFromString(std::string_view s) {
    if (s == "unordered") return OrderType::UNORDERED;
    if (s == "ascending" || s == "asc") return OrderType::ASCENDING;
    if (s == "descending" || s == "desc") return OrderType::DESCENDING;
    return std::nullopt;
}

const char* indexTypeToString(IndexType t) {
    switch (t) {
        case IndexType::EQUALITY: return "eq";
        default: return "eq";
    }
}

Index Index::byEquality(std::string field_name) {
    Index idx;
    idx.order.field_name = field_name;
    idx.order.type = OrderType::ASCENDING;
    idx.field_name = std::move(field_name);
    idx.type = IndexType::EQUALITY;
    idx.string_order_pad_length = 16;
    idx.base32_encode = false;
    return idx;
}

Query Index::toQuery(std::optional<Value> value) const {
    Query q;
    q.field_name = field_name;
    q.type = type;
    q.order = order;
    q.value = std::move(value);
    return q;
}

const std::string& Index::orderFieldName() const {
    return order.field_name.empty() ? field_name : order.field_name;
}

bool Index::hasSeparateOrderField() const {
    return !order.field_name.empty() && order.field_name != field_name;
}

Query Query::equals(std::string field_name, Value value) {
    Query q;
    q.order.field_name = field_name;
    q.order.type = OrderType::ASCENDING;
    q.field_name = std::move(field_name);
    q.type = IndexType::EQUALITY;
    q.value = std::move(value);
    return q;
}

Query Query::all(std::string field_name, OrderType order) {
    Query q;
    q.order.field_name = field_name;
    q.order.type = order;
    q.field_name = std::move(field_name);
    q.type = IndexType::EQUALITY;
    return q;
}

bool indexMatchesQuery(const Index& index, const Query& query) {
    return index.field_name == query.field_name &&
           index.type == query.type &&
           index.order.type == query.order.type;
}

bool indexesMatch(const Index& a, const Index& b) {
    return a.field_name == b.field_name &&
           a.type == b.type &&
           a.order.type == b.order.type;
}

const Index* findMatchingIndex(const std::vector<Index>& indexes, const Query& query) {
    for (const auto& idx : indexes) {
        if (indexMatchesQuery(idx, query)) return &idx;
    }
    return nullptr;
}

std::string describeQuery(const Query& query) {
    std::string out = "field=" + query.field_name;
    out += " type=";
    out += indexTypeToString(query.type);
    out += " order=";
    out += orderTypeToString(query.order.type);
    return out;
}

} // namespace kvindex
