#pragma once

#include "index/index_definition.h"
#include "storage/kv_store.h"
#include "storage/record.h"
#include "utils/status.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kvindex {

/// Model: Sekundärindizes über einem KVStore ohne Transaktionen
/// - Jeder Record wird unter einem Key pro Index gespeichert (Wert = ganzer Record)
/// - Key-Schema siehe KeySchema: <ns>:<indexName>[:<filter>]:<order>:<id>
/// - Der Identitäts-Index (Default: unordered auf "id") wird immer als letzter
///   Index angehängt
/// - Save entfernt veraltete Keys und prüft Unique-Indizes vor dem ersten Write
/// - Keine Atomarität über mehrere Keys: bricht ein Save mittendrin ab, bleiben
///   bereits geschriebene Keys stehen
/// - Keine Exceptions im API: Status-Objekt mit ErrorCode
/// - Erzeugung nur über create(): Indexdefinitionen werden vorab geprüft
class Model {
public:
    struct Options {
        bool debug = false;               // loggt alle Keys (DEBUG-Level)
        std::optional<Index> id_index;    // leer -> defaultIdIndex()
    };

    /// Unordered equality index on the identity field
    static Index defaultIdIndex(std::string field = "id");

    static std::pair<Status, std::unique_ptr<Model>> create(KVStore& store, std::string ns,
                                                            std::vector<Index> indexes);
    static std::pair<Status, std::unique_ptr<Model>> create(KVStore& store, std::string ns,
                                                            std::vector<Index> indexes, Options options);

    /// InvalidArgument for an empty field, a negative pad length or two
    /// indexes (identity included) that share a key prefix
    static Status validateIndexes(const std::vector<Index>& indexes, const Index& idIndex);

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    /// Save any value convertible to a JSON object (nlohmann to_json)
    template <typename T>
    Status save(const T& instance);

    Status saveJson(const nlohmann::json& doc);

    /// Exactly one match (NotFound / MultipleRecordsFound otherwise)
    template <typename T>
    Status read(const Query& query, T& out);

    std::pair<Status, nlohmann::json> readJson(const Query& query);

    /// All matches in index order; honours query.offset / query.limit
    template <typename T>
    Status list(const Query& query, std::vector<T>& out);

    std::pair<Status, std::vector<nlohmann::json>> listJson(const Query& query);

    /// Delete by identity query only; removes identity and all secondary keys
    Status erase(const Query& query);

    /// Query on the identity index
    Query identityQuery(Value id) const;

    const Index& idIndex() const { return indexes_.back(); }

    /// Declared indexes followed by the identity index
    const std::vector<Index>& indexes() const { return indexes_; }

    const std::string& getNamespace() const { return namespace_; }

    /// Full store key of `record` under `index` (with identity suffix)
    std::pair<Status, std::string> keyFor(const Index& index, const Record& record) const;

private:
    Model(KVStore& store, std::string ns, std::vector<Index> indexes, Options options);

    KVStore& store_;
    // trennt logisch Keys mehrerer Models, die sich einen Store teilen
    std::string namespace_;
    std::vector<Index> indexes_;
    Options options_;
    // serialisiert Save/Erase (Read-Modify-Write) innerhalb dieser Instanz
    std::mutex write_mutex_;

    std::pair<Status, Value> identityOf_(const Record& record) const;
    std::pair<Status, std::string> scanKeyFor_(const Index& index, const Query& query) const;
    std::pair<Status, std::vector<KVRecord>> scan_(const Query& query, int64_t offset, int64_t limit);
    std::pair<Status, std::vector<KVRecord>> scanIndex_(const Index& index, const Query& query,
                                                        int64_t offset, int64_t limit);
    static std::pair<Status, std::vector<Record>> decodeAll_(const std::vector<KVRecord>& recs);
    std::pair<Status, std::vector<Record>> listRecords_(const Query& query);
    std::pair<Status, std::vector<std::string>> keysFor_(const Record& record) const;
    std::vector<std::optional<std::string>> existingKeysFor_(const Record& record) const;
    Status checkUnique_(const Record& record, const Value& id);
};

// ===== Template-Einstiegspunkte =====

template <typename T>
Status Model::save(const T& instance) {
    nlohmann::json doc;
    try {
        doc = instance;
    } catch (const nlohmann::json::exception& e) {
        return Status::Error(ErrorCode::StoreError, std::string("save: Serialisierung fehlgeschlagen: ") + e.what());
    }
    return saveJson(doc);
}

template <typename T>
Status Model::read(const Query& query, T& out) {
    auto [st, doc] = readJson(query);
    if (!st.ok) return st;
    try {
        out = doc.template get<T>();
    } catch (const nlohmann::json::exception& e) {
        return Status::Error(ErrorCode::StoreError, std::string("read: Deserialisierung fehlgeschlagen: ") + e.what());
    }
    return Status::OK();
}

template <typename T>
Status Model::list(const Query& query, std::vector<T>& out) {
    auto [st, docs] = listJson(query);
    if (!st.ok) return st;
    std::vector<T> result;
    result.reserve(docs.size());
    try {
        for (const auto& doc : docs) {
            result.push_back(doc.template get<T>());
        }
    } catch (const nlohmann::json::exception& e) {
        return Status::Error(ErrorCode::StoreError, std::string("list: Deserialisierung fehlgeschlagen: ") + e.what());
    }
    out = std::move(result);
    return Status::OK();
}

} // namespace kvindex
