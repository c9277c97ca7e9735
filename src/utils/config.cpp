#include "utils/config.h"
#include "index/model.h"
#include "storage/memory_store.h"
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace kvindex {

namespace {

OrderType parseOrder(const std::string& name) {
    auto order = orderTypeFromString(name);
    if (!order) {
        throw std::invalid_argument("unknown order '" + name + "' (expected unordered|ascending|descending)");
    }
    return *order;
}

Config::IndexConfig indexFromYaml(const YAML::Node& node) {
    Config::IndexConfig idx;
    idx.field = node["field"].as<std::string>("");
    idx.order_field = node["order_field"].as<std::string>("");
    if (node["order"]) {
        idx.order = parseOrder(node["order"].as<std::string>());
    }
    idx.unique = node["unique"].as<bool>(false);
    idx.string_pad_length = node["string_pad_length"].as<int>(16);
    idx.base32 = node["base32"].as<bool>(false);
    return idx;
}

Config::IndexConfig indexFromJson(const json& j) {
    Config::IndexConfig idx;
    idx.field = j.value("field", "");
    idx.order_field = j.value("order_field", "");
    if (j.contains("order")) {
        idx.order = parseOrder(j["order"].get<std::string>());
    }
    idx.unique = j.value("unique", false);
    idx.string_pad_length = j.value("string_pad_length", 16);
    idx.base32 = j.value("base32", false);
    return idx;
}

} // namespace

RocksDBStore::Config Config::StorageConfig::toRocksDBConfig() const {
    RocksDBStore::Config cfg;
    cfg.db_path = db_path;
    cfg.memtable_size_mb = memtable_size_mb;
    cfg.block_cache_size_mb = block_cache_size_mb;
    cfg.bloom_bits_per_key = bloom_bits_per_key;
    cfg.enable_wal = enable_wal;
    cfg.compression = compression;
    return cfg;
}

std::pair<Status, Config> Config::loadFromYaml(const std::string& yaml_path) {
    Config result;
    try {
        YAML::Node config = YAML::LoadFile(yaml_path);

        // Logging
        if (config["logging"]) {
            auto logging = config["logging"];
            result.logging.level = logging["level"].as<std::string>("info");
            result.logging.file = logging["file"].as<std::string>("");
            result.logging.pattern = logging["pattern"].as<std::string>("");
        }

        // Storage backend
        if (config["storage"]) {
            auto storage = config["storage"];
            result.storage.backend = storage["backend"].as<std::string>("rocksdb");
            result.storage.db_path = storage["db_path"].as<std::string>("./data/kvindex");
            result.storage.memtable_size_mb = storage["memtable_size_mb"].as<size_t>(64);
            result.storage.block_cache_size_mb = storage["block_cache_size_mb"].as<size_t>(256);
            result.storage.bloom_bits_per_key = storage["bloom_bits_per_key"].as<int>(10);
            result.storage.enable_wal = storage["enable_wal"].as<bool>(true);
            result.storage.compression = storage["compression"].as<std::string>("none");
        }

        // Models + Indizes
        if (config["models"]) {
            for (const auto& m : config["models"]) {
                ModelConfig model;
                model.ns = m["namespace"].as<std::string>("");
                model.id_field = m["id_field"].as<std::string>("id");
                model.debug = m["debug"].as<bool>(false);
                if (m["indexes"]) {
                    for (const auto& idx : m["indexes"]) {
                        model.indexes.push_back(indexFromYaml(idx));
                    }
                }
                result.models.push_back(std::move(model));
            }
        }
    } catch (const std::exception& e) {
        KVINDEX_ERROR("Failed to load configuration from {}: {}", yaml_path, e.what());
        return {Status::Error(ErrorCode::InvalidArgument,
            "configuration '" + yaml_path + "': " + e.what()), Config()};
    }

    auto st = result.validate();
    if (!st.ok) {
        KVINDEX_ERROR("Invalid configuration in {}: {}", yaml_path, st.message);
        return {st, Config()};
    }
    KVINDEX_INFO("Loaded configuration from {} ({} models)", yaml_path, result.models.size());
    return {Status::OK(), std::move(result)};
}

std::pair<Status, Config> Config::fromJson(const json& j) {
    Config result;
    try {
        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            result.logging.level = logging.value("level", "info");
            result.logging.file = logging.value("file", "");
            result.logging.pattern = logging.value("pattern", "");
        }

        if (j.contains("storage")) {
            const auto& storage = j["storage"];
            result.storage.backend = storage.value("backend", "rocksdb");
            result.storage.db_path = storage.value("db_path", "./data/kvindex");
            result.storage.memtable_size_mb = storage.value("memtable_size_mb", size_t{64});
            result.storage.block_cache_size_mb = storage.value("block_cache_size_mb", size_t{256});
            result.storage.bloom_bits_per_key = storage.value("bloom_bits_per_key", 10);
            result.storage.enable_wal = storage.value("enable_wal", true);
            result.storage.compression = storage.value("compression", "none");
        }

        if (j.contains("models")) {
            for (const auto& m : j["models"]) {
                ModelConfig model;
                model.ns = m.value("namespace", "");
                model.id_field = m.value("id_field", "id");
                model.debug = m.value("debug", false);
                if (m.contains("indexes")) {
                    for (const auto& idx : m["indexes"]) {
                        model.indexes.push_back(indexFromJson(idx));
                    }
                }
                result.models.push_back(std::move(model));
            }
        }
    } catch (const std::exception& e) {
        KVINDEX_ERROR("Failed to parse configuration from JSON: {}", e.what());
        return {Status::Error(ErrorCode::InvalidArgument, std::string("configuration: ") + e.what()), Config()};
    }

    auto st = result.validate();
    if (!st.ok) return {st, Config()};
    return {Status::OK(), std::move(result)};
}

json Config::toJson() const {
    json j;

    j["logging"]["level"] = logging.level;
    if (!logging.file.empty()) {
        j["logging"]["file"] = logging.file;
    }
    if (!logging.pattern.empty()) {
        j["logging"]["pattern"] = logging.pattern;
    }

    j["storage"]["backend"] = storage.backend;
    j["storage"]["db_path"] = storage.db_path;
    j["storage"]["memtable_size_mb"] = storage.memtable_size_mb;
    j["storage"]["block_cache_size_mb"] = storage.block_cache_size_mb;
    j["storage"]["bloom_bits_per_key"] = storage.bloom_bits_per_key;
    j["storage"]["enable_wal"] = storage.enable_wal;
    j["storage"]["compression"] = storage.compression;

    j["models"] = json::array();
    for (const auto& model : models) {
        json m;
        m["namespace"] = model.ns;
        m["id_field"] = model.id_field;
        m["debug"] = model.debug;
        m["indexes"] = json::array();
        for (const auto& idx : model.indexes) {
            json ij;
            ij["field"] = idx.field;
            if (!idx.order_field.empty()) {
                ij["order_field"] = idx.order_field;
            }
            ij["order"] = orderTypeToString(idx.order);
            ij["unique"] = idx.unique;
            ij["string_pad_length"] = idx.string_pad_length;
            ij["base32"] = idx.base32;
            m["indexes"].push_back(std::move(ij));
        }
        j["models"].push_back(std::move(m));
    }
    return j;
}

Status Config::validate() const {
    if (storage.backend != "rocksdb" && storage.backend != "memory") {
        return Status::Error(ErrorCode::InvalidArgument,
            "unknown storage backend '" + storage.backend + "' (expected rocksdb|memory)");
    }
    if (storage.backend == "rocksdb" && storage.db_path.empty()) {
        return Status::Error(ErrorCode::InvalidArgument, "storage.db_path must not be empty");
    }
    for (const auto& model : models) {
        if (model.ns.empty()) {
            return Status::Error(ErrorCode::InvalidArgument, "model without namespace");
        }
        if (model.id_field.empty()) {
            return Status::Error(ErrorCode::InvalidArgument, "model '" + model.ns + "': empty id_field");
        }
        // gleiche Prüfung wie Model::create, damit Fehler schon beim Laden auffallen
        auto st = Model::validateIndexes(buildIndexes(model), buildIdIndex(model));
        if (!st.ok) {
            return Status::Error(ErrorCode::InvalidArgument, "model '" + model.ns + "': " + st.message);
        }
    }
    return Status::OK();
}

const Config::ModelConfig* Config::findModel(const std::string& ns) const {
    for (const auto& model : models) {
        if (model.ns == ns) return &model;
    }
    return nullptr;
}

std::vector<Index> Config::buildIndexes(const ModelConfig& model) {
    std::vector<Index> out;
    out.reserve(model.indexes.size());
    for (const auto& ic : model.indexes) {
        Index idx = Index::byEquality(ic.field);
        if (!ic.order_field.empty()) {
            idx.order.field_name = ic.order_field;
        }
        idx.order.type = ic.order;
        idx.unique = ic.unique;
        idx.string_order_pad_length = ic.string_pad_length;
        idx.base32_encode = ic.base32;
        out.push_back(std::move(idx));
    }
    return out;
}

Index Config::buildIdIndex(const ModelConfig& model) {
    Index idx = Index::byEquality(model.id_field);
    idx.order.type = OrderType::UNORDERED;
    return idx;
}

void Config::applyLogging() const {
    utils::Logger::init(logging.file, utils::Logger::levelFromString(logging.level));
    if (!logging.pattern.empty()) {
        utils::Logger::setPattern(logging.pattern);
    }
}

std::pair<Status, std::unique_ptr<KVStore>> Config::openStore() const {
    if (storage.backend == "memory") {
        return {Status::OK(), std::make_unique<MemoryStore>()};
    }
    if (storage.backend != "rocksdb") {
        return {Status::Error(ErrorCode::InvalidArgument, "unknown storage backend '" + storage.backend + "'"), nullptr};
    }
    auto store = std::make_unique<RocksDBStore>(storage.toRocksDBConfig());
    if (!store->open()) {
        return {Status::Error(ErrorCode::StoreError, "failed to open RocksDB at '" + storage.db_path + "'"), nullptr};
    }
    return {Status::OK(), std::move(store)};
}

} // namespace kvindex
