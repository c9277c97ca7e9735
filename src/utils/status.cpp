#include "utils/status.h"

namespace kvindex {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::MultipleRecordsFound: return "MultipleRecordsFound";
        case ErrorCode::NoMatchingIndex: return "NoMatchingIndex";
        case ErrorCode::MissingIdentity: return "MissingIdentity";
        case ErrorCode::UniqueConstraintViolation: return "UniqueConstraintViolation";
        case ErrorCode::UnsupportedEncoding: return "UnsupportedEncoding";
        case ErrorCode::UnsupportedDeleteQuery: return "UnsupportedDeleteQuery";
        case ErrorCode::StoreError: return "StoreError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

std::string Status::toString() const {
    if (ok) return "OK";
    std::string out = errorCodeToString(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace kvindex
