// EN: Error code names and formatting.
// FR: Noms des codes d'erreur et formatage.

#include "infrastructure/system/ingest_error.hpp"

namespace CIP {

const char* errorToString(IngestError error) {
    switch (error) {
        case IngestError::SUCCESS:            return "SUCCESS";
        case IngestError::UNSUPPORTED_SOURCE: return "UNSUPPORTED_SOURCE";
        case IngestError::FILE_NOT_FOUND:     return "FILE_NOT_FOUND";
        case IngestError::FILE_READ_ERROR:    return "FILE_READ_ERROR";
        case IngestError::ENCODING_ERROR:     return "ENCODING_ERROR";
        case IngestError::EMPTY_FILE:         return "EMPTY_FILE";
        case IngestError::ROW_TOO_LARGE:      return "ROW_TOO_LARGE";
        case IngestError::TOKENIZER_FATAL:    return "TOKENIZER_FATAL";
        case IngestError::CONSUMER_ERROR:     return "CONSUMER_ERROR";
        case IngestError::INVALID_CONFIG:     return "INVALID_CONFIG";
        case IngestError::INVALID_STATE:      return "INVALID_STATE";
    }
    return "UNKNOWN";
}

std::string ErrorInfo::toString() const {
    std::string result = std::string(errorToString(code)) + ": " + message;
    if (row) {
        result += " (row " + std::to_string(*row) + ")";
    }
    return result;
}

} // namespace CIP
