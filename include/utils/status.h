#pragma once

#include <string>
#include <utility>

namespace kvindex {

/// Error taxonomy shared by stores, key encoding and the index model
enum class ErrorCode {
    OK,
    NotFound,                   // Read/Delete: kein Treffer
    MultipleRecordsFound,       // Read: mehr als ein Treffer
    NoMatchingIndex,            // Query passt zu keinem deklarierten Index
    MissingIdentity,            // Record ohne (nicht-leere) Identität
    UniqueConstraintViolation,  // Unique-Wert gehört bereits einer anderen Identität
    UnsupportedEncoding,        // Feldtyp ohne ordnungserhaltende Kodierung
    UnsupportedDeleteQuery,     // Delete nur über den Identitäts-Index
    StoreError,                 // I/O oder (De-)Serialisierung
    InvalidArgument             // ungültige Index-Definition / Konfiguration
};

const char* errorCodeToString(ErrorCode code);

/**
 * @brief Generic status type for kvindex operations
 *
 * No exceptions cross the public API: every operation returns a Status,
 * or std::pair<Status, T> when it also yields a value.
 */
struct Status {
    bool ok = true;
    ErrorCode code = ErrorCode::OK;
    std::string message;

    static Status OK() { return {}; }
    static Status Error(ErrorCode code, std::string msg) { return Status{false, code, std::move(msg)}; }

    bool is(ErrorCode c) const { return code == c; }

    /// "<CodeName>: <message>" (oder "OK")
    std::string toString() const;
};

} // namespace kvindex
