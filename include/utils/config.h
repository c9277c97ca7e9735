#pragma once

#include "index/index_definition.h"
#include "storage/kv_store.h"
#include "storage/rocksdb_store.h"
#include "utils/logger.h"
#include "utils/status.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace kvindex {

using json = nlohmann::json;

/**
 * @brief Configuration for logging, the storage backend and the index models
 *
 * Beispiel (YAML):
 *   logging:
 *     level: debug
 *   storage:
 *     backend: rocksdb
 *     db_path: ./data/users
 *   models:
 *     - namespace: users
 *       indexes:
 *         - { field: email, order: unordered, unique: true }
 *         - { field: age, order: descending }
 */
struct Config {
    struct LoggingConfig {
        std::string level = "info";                     // trace|debug|info|warn|error|critical
        std::string file;                               // leer = nur Konsole
        std::string pattern;                            // leer = Default-Pattern des Loggers
    } logging;

    struct StorageConfig {
        std::string backend = "rocksdb";                // rocksdb | memory
        std::string db_path = "./data/kvindex";
        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 256;
        int bloom_bits_per_key = 10;
        bool enable_wal = true;
        std::string compression = "none";

        RocksDBStore::Config toRocksDBConfig() const;
    } storage;

    struct IndexConfig {
        std::string field;
        std::string order_field;                        // leer = field
        OrderType order = OrderType::ASCENDING;
        bool unique = false;
        int string_pad_length = 16;
        bool base32 = false;
    };

    struct ModelConfig {
        std::string ns;                                 // YAML/JSON key "namespace"
        std::string id_field = "id";
        bool debug = false;
        std::vector<IndexConfig> indexes;
    };
    std::vector<ModelConfig> models;

    /**
     * @brief Load configuration from YAML file
     * @return InvalidArgument on unreadable files, YAML errors or bad index definitions
     */
    static std::pair<Status, Config> loadFromYaml(const std::string& yaml_path);

    /**
     * @brief Load configuration from JSON
     */
    static std::pair<Status, Config> fromJson(const json& j);

    /**
     * @brief Convert to JSON
     */
    json toJson() const;

    /// Model section by namespace, nullptr if not configured
    const ModelConfig* findModel(const std::string& ns) const;

    /// Index definitions for a model section (without the identity index)
    static std::vector<Index> buildIndexes(const ModelConfig& model);

    /// Identity index for a model section (unordered equality on id_field)
    static Index buildIdIndex(const ModelConfig& model);

    /// Logger::init + pattern according to the logging section
    void applyLogging() const;

    /// Opens the configured backend (RocksDB is opened before returning)
    std::pair<Status, std::unique_ptr<KVStore>> openStore() const;

    /// Rejects unknown backends and index sets Model::validateIndexes rejects
    /// (empty fields, negative pad lengths, colliding index names)
    Status validate() const;
};

} // namespace kvindex
