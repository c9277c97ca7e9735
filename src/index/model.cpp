// Index model implementation

#include "index/model.h"
#include "index/key_encoder.h"
#include "storage/key_schema.h"
#include "utils/logger.h"

#include <set>
#include <stdexcept>

namespace kvindex {

namespace {
bool isEmptyIdentity(const Value& v) {
	if (std::holds_alternative<std::monostate>(v)) return true;
	if (const auto* s = std::get_if<std::string>(&v)) return s->empty();
	return false;
}
} // namespace

// static
Index Model::defaultIdIndex(std::string field) {
	Index idx = Index::byEquality(std::move(field));
	idx.order.type = OrderType::UNORDERED;
	return idx;
}

// static
Status Model::validateIndexes(const std::vector<Index>& indexes, const Index& idIndex) {
	// Gleicher Indexname = gleicher Key-Prefix: Scans würden fremde Einträge liefern
	std::set<std::string> names;
	auto check = [&names](const Index& index) -> Status {
		if (index.field_name.empty()) {
			return Status::Error(ErrorCode::InvalidArgument, "index without field name");
		}
		if (index.string_order_pad_length < 0) {
			return Status::Error(ErrorCode::InvalidArgument,
				"index on '" + index.field_name + "': negative string_order_pad_length");
		}
		std::string name = KeySchema::makeIndexName(index);
		if (!names.insert(name).second) {
			return Status::Error(ErrorCode::InvalidArgument,
				"index on '" + index.field_name + "' (order field '" + index.orderFieldName() +
				"') collides with another index named '" + name + "'");
		}
		return Status::OK();
	};
	for (const auto& index : indexes) {
		auto st = check(index);
		if (!st.ok) return st;
	}
	return check(idIndex);
}

// static
std::pair<Status, std::unique_ptr<Model>> Model::create(KVStore& store, std::string ns, std::vector<Index> indexes) {
	return create(store, std::move(ns), std::move(indexes), Options{});
}

// static
std::pair<Status, std::unique_ptr<Model>> Model::create(KVStore& store, std::string ns, std::vector<Index> indexes,
														Options options) {
	if (!options.id_index || options.id_index->field_name.empty()) {
		options.id_index = defaultIdIndex();
	}
	auto st = validateIndexes(indexes, *options.id_index);
	if (!st.ok) {
		KVINDEX_ERROR("Model '{}' abgelehnt: {}", ns, st.message);
		return {st, nullptr};
	}
	return {Status::OK(), std::unique_ptr<Model>(new Model(store, std::move(ns), std::move(indexes), std::move(options)))};
}

Model::Model(KVStore& store, std::string ns, std::vector<Index> indexes, Options options)
	: store_(store), namespace_(std::move(ns)), indexes_(std::move(indexes)), options_(std::move(options)) {
	indexes_.push_back(*options_.id_index);
	KVINDEX_DEBUG("Model '{}' erstellt: {} Indizes (+ Identität '{}')",
				  namespace_, indexes_.size() - 1, idIndex().field_name);
}

Query Model::identityQuery(Value id) const {
	return idIndex().toQuery(std::move(id));
}

std::pair<Status, Value> Model::identityOf_(const Record& record) const {
	const std::string& idField = idIndex().field_name;
	auto id = record.getField(idField);
	if (!id) {
		return {Status::Error(ErrorCode::MissingIdentity,
			"record has no usable identity field '" + idField + "' (" + record.fieldTypeName(idField) + ")"), {}};
	}
	if (isEmptyIdentity(*id)) {
		return {Status::Error(ErrorCode::MissingIdentity, "identity field '" + idField + "' is empty"), {}};
	}
	return {Status::OK(), std::move(*id)};
}

// Key-Aufbau: <ns>:<indexName>[:<filter>]:<encodedOrder>:<id>
std::pair<Status, std::string> Model::keyFor(const Index& index, const Record& record) const {
	auto [idSt, id] = identityOf_(record);
	if (!idSt.ok) return {idSt, {}};

	std::optional<std::string> filterValue;
	if (index.hasSeparateOrderField()) {
		auto filter = record.getField(index.field_name);
		if (!filter || std::holds_alternative<std::monostate>(*filter)) {
			return {Status::Error(ErrorCode::UnsupportedEncoding,
				"field '" + index.field_name + "' has unsupported type " + record.fieldTypeName(index.field_name)), {}};
		}
		filterValue = valueToString(*filter);
	}

	const std::string& orderField = index.orderFieldName();
	auto orderValue = record.getField(orderField);
	if (!orderValue) {
		return {Status::Error(ErrorCode::UnsupportedEncoding,
			"field '" + orderField + "' has unsupported type " + record.fieldTypeName(orderField)), {}};
	}
	auto [encSt, encoded] = KeyEncoder::encodeOrderValue(index, orderField, *orderValue);
	if (!encSt.ok) return {encSt, {}};

	return {Status::OK(), KeySchema::makeIndexKey(namespace_, index, filterValue, encoded, valueToString(id))};
}

std::pair<Status, std::vector<std::string>> Model::keysFor_(const Record& record) const {
	std::vector<std::string> keys;
	keys.reserve(indexes_.size());
	for (const auto& index : indexes_) {
		auto [st, key] = keyFor(index, record);
		if (!st.ok) return {st, {}};
		keys.push_back(std::move(key));
	}
	return {Status::OK(), std::move(keys)};
}

// Keys eines gespeicherten Records; nullopt für Indizes, unter denen er nicht
// kodierbar ist (dort kann folglich auch kein Key existieren)
std::vector<std::optional<std::string>> Model::existingKeysFor_(const Record& record) const {
	std::vector<std::optional<std::string>> keys;
	keys.reserve(indexes_.size());
	for (const auto& index : indexes_) {
		auto [st, key] = keyFor(index, record);
		if (st.ok) {
			keys.emplace_back(std::move(key));
		} else {
			KVINDEX_DEBUG("kein Key für Index '{}': {}", KeySchema::makeIndexName(index), st.message);
			keys.emplace_back(std::nullopt);
		}
	}
	return keys;
}

std::pair<Status, std::string> Model::scanKeyFor_(const Index& index, const Query& query) const {
	if (!query.value) {
		return {Status::OK(), KeySchema::makeIndexPrefix(namespace_, index)};
	}
	if (std::holds_alternative<std::monostate>(*query.value)) {
		return {Status::Error(ErrorCode::UnsupportedEncoding,
			"query value for field '" + query.field_name + "' has unsupported type null"), {}};
	}
	if (index.hasSeparateOrderField()) {
		// Filterwert steht unverändert im Key, alle Sortierwerte darunter
		return {Status::OK(), KeySchema::makeFilterPrefix(namespace_, index, valueToString(*query.value))};
	}
	auto [st, encoded] = KeyEncoder::encodeOrderValue(index, index.field_name, *query.value);
	if (!st.ok) return {st, {}};
	return {Status::OK(), KeySchema::makeIndexKey(namespace_, index, std::nullopt, encoded, std::nullopt)};
}

std::pair<Status, std::vector<KVRecord>> Model::scan_(const Query& query, int64_t offset, int64_t limit) {
	const Index* index = findMatchingIndex(indexes_, query);
	if (!index) {
		return {Status::Error(ErrorCode::NoMatchingIndex,
			"no index matches query (" + describeQuery(query) + ") in namespace '" + namespace_ + "'"), {}};
	}
	return scanIndex_(*index, query, offset, limit);
}

std::pair<Status, std::vector<KVRecord>> Model::scanIndex_(const Index& index, const Query& query,
															int64_t offset, int64_t limit) {
	auto [keySt, key] = scanKeyFor_(index, query);
	if (!keySt.ok) return {keySt, {}};

	if (options_.debug) {
		KVINDEX_DEBUG("Listing key '{}' (offset={}, limit={})", key, offset, limit);
	}
	auto [st, recs] = store_.scanPrefix(key, offset, limit);
	if (!st.ok) {
		KVINDEX_WARN("scan '{}' fehlgeschlagen: {}", key, st.message);
		return {st, {}};
	}
	return {Status::OK(), std::move(recs)};
}

// static
std::pair<Status, std::vector<Record>> Model::decodeAll_(const std::vector<KVRecord>& recs) {
	std::vector<Record> out;
	out.reserve(recs.size());
	for (const auto& rec : recs) {
		try {
			out.push_back(Record::deserialize(rec.value));
		} catch (const std::exception& e) {
			KVINDEX_ERROR("Deserialisierung fehlgeschlagen für Key={}: {}", rec.key, e.what());
			return {Status::Error(ErrorCode::StoreError,
				"corrupt record under key '" + rec.key + "': " + e.what()), {}};
		}
	}
	return {Status::OK(), std::move(out)};
}

std::pair<Status, std::vector<Record>> Model::listRecords_(const Query& query) {
	auto [st, recs] = scan_(query, query.offset, query.limit);
	if (!st.ok) return {st, {}};
	return decodeAll_(recs);
}

std::pair<Status, nlohmann::json> Model::readJson(const Query& query) {
	// Limit 2 reicht, um "mehr als einer" zu erkennen
	auto [st, recs] = scan_(query, query.offset, 2);
	if (!st.ok) return {st, nullptr};
	if (recs.empty()) {
		return {Status::Error(ErrorCode::NotFound, "no record for query (" + describeQuery(query) + ")"), nullptr};
	}
	if (recs.size() > 1) {
		return {Status::Error(ErrorCode::MultipleRecordsFound,
			"more than one record for query (" + describeQuery(query) + ")"), nullptr};
	}
	try {
		return {Status::OK(), nlohmann::json::parse(recs[0].value.begin(), recs[0].value.end())};
	} catch (const nlohmann::json::exception& e) {
		return {Status::Error(ErrorCode::StoreError,
			"corrupt record under key '" + recs[0].key + "': " + e.what()), nullptr};
	}
}

std::pair<Status, std::vector<nlohmann::json>> Model::listJson(const Query& query) {
	auto [st, records] = listRecords_(query);
	if (!st.ok) return {st, {}};
	std::vector<nlohmann::json> out;
	out.reserve(records.size());
	for (const auto& rec : records) {
		out.push_back(rec.json());
	}
	return {Status::OK(), std::move(out)};
}

Status Model::checkUnique_(const Record& record, const Value& id) {
	const std::string& idField = idIndex().field_name;
	for (size_t i = 0; i + 1 < indexes_.size(); ++i) {
		const Index& index = indexes_[i];
		if (!index.unique) continue;

		auto value = record.getField(index.field_name);
		if (!value) continue; // keysFor_ hat fehlende Werte bereits abgelehnt

		// direkt auf diesem Index scannen (nicht über das Query-Matching)
		auto [scanSt, recs] = scanIndex_(index, index.toQuery(*value), 0, 0);
		if (!scanSt.ok) return scanSt;
		auto [st, existing] = decodeAll_(recs);
		if (!st.ok) return st;
		for (const auto& other : existing) {
			auto otherId = other.getField(idField);
			if (!otherId || *otherId != id) {
				KVINDEX_WARN("Unique constraint violation: {}.{} = {}", namespace_, index.field_name, valueToString(*value));
				return Status::Error(ErrorCode::UniqueConstraintViolation,
					"unique index on '" + index.field_name + "' already holds value '" + valueToString(*value) +
					"' for another identity");
			}
		}
	}
	return Status::OK();
}

Status Model::saveJson(const nlohmann::json& doc) {
	Record record;
	try {
		record = Record::fromJson(doc);
	} catch (const std::invalid_argument& e) {
		return Status::Error(ErrorCode::MissingIdentity, std::string("save: ") + e.what());
	}

	auto [idSt, id] = identityOf_(record);
	if (!idSt.ok) return idSt;

	// Alle neuen Keys vorab berechnen: Kodierungsfehler vor dem ersten Write
	auto [keySt, newKeys] = keysFor_(record);
	if (!keySt.ok) return keySt;

	Record::Blob blob;
	try {
		blob = record.serialize();
	} catch (const nlohmann::json::exception& e) {
		return Status::Error(ErrorCode::StoreError, std::string("save: Serialisierung fehlgeschlagen: ") + e.what());
	}

	std::lock_guard<std::mutex> lock(write_mutex_);

	// Alte Version laden, um veraltete Indexeinträge bereinigen zu können
	auto [oldSt, oldList] = listRecords_(identityQuery(id));
	if (!oldSt.ok) return oldSt;
	if (oldList.size() > 1) {
		return Status::Error(ErrorCode::MultipleRecordsFound,
			"identity '" + valueToString(id) + "' is stored more than once");
	}
	std::vector<std::optional<std::string>> oldKeys(indexes_.size());
	if (!oldList.empty()) {
		oldKeys = existingKeysFor_(oldList.front());
	}

	// Unique-Constraints prüfen, bevor irgendetwas geschrieben wird
	auto uniqueSt = checkUnique_(record, id);
	if (!uniqueSt.ok) return uniqueSt;

	for (size_t i = 0; i < indexes_.size(); ++i) {
		// z.B. byOrderedSlug: "hi-there" -> "hello-there" darf keinen zweiten Eintrag hinterlassen
		if (oldKeys[i] && *oldKeys[i] != newKeys[i]) {
			if (options_.debug) KVINDEX_DEBUG("Deleting stale key '{}'", *oldKeys[i]);
			auto st = store_.del(*oldKeys[i]);
			if (!st.ok) return st;
		}
		if (options_.debug) {
			KVINDEX_DEBUG("Saving key '{}', value: '{}'", newKeys[i], std::string(blob.begin(), blob.end()));
		}
		auto st = store_.write(newKeys[i], blob);
		if (!st.ok) {
			KVINDEX_ERROR("save: Schreiben von '{}' fehlgeschlagen: {}", newKeys[i], st.message);
			return st;
		}
	}
	return Status::OK();
}

Status Model::erase(const Query& query) {
	if (!indexMatchesQuery(idIndex(), query) || !query.value) {
		return Status::Error(ErrorCode::UnsupportedDeleteQuery,
			"delete requires an identity query on '" + idIndex().field_name + "', got (" + describeQuery(query) + ")");
	}

	std::lock_guard<std::mutex> lock(write_mutex_);

	Query exact = query;
	exact.offset = 0;
	exact.limit = 0;
	auto [st, found] = listRecords_(exact);
	if (!st.ok) return st;
	if (found.empty()) {
		return Status::Error(ErrorCode::NotFound, "no record to delete for " + idIndex().field_name + "=" +
			valueToString(*query.value));
	}

	for (const auto& record : found) {
		// Identitäts-Key zuletzt: bei Abbruch bleibt der Record auffindbar und erneut löschbar
		for (const auto& key : existingKeysFor_(record)) {
			if (!key) continue;
			if (options_.debug) KVINDEX_DEBUG("Deleting key '{}'", *key);
			auto delSt = store_.del(*key);
			if (!delSt.ok) {
				KVINDEX_ERROR("erase: Löschen von '{}' fehlgeschlagen: {}", *key, delSt.message);
				return delSt;
			}
		}
	}
	return Status::OK();
}

} // namespace kvindex
