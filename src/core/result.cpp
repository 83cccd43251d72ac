#include "peerlink/core/result.hpp"

namespace peerlink::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:              return "success";
        case ErrorCode::CONNECTION_REFUSED:   return "connection refused";
        case ErrorCode::NOT_CONNECTED:        return "not connected";
        case ErrorCode::LEDGER_ERROR:         return "resume ledger error";
        case ErrorCode::INVALID_ARGUMENT:     return "invalid argument";
        case ErrorCode::NOT_FOUND:            return "not found";
        case ErrorCode::INVALID_STATE:        return "invalid state";
        case ErrorCode::DUPLICATE_JOB:        return "duplicate job";
        case ErrorCode::FILE_READ_ERROR:      return "file read error";
        case ErrorCode::FILE_WRITE_ERROR:     return "file write error";
    }
    return "unknown";
}

}
