#pragma once

#include <string>
#include <cstdint>

namespace peerlink::core {

enum class ErrorCode {
    SUCCESS = 0,

    // Connection level. Socket failures stay inside the reconnect state
    // machine and surface as state events.
    CONNECTION_REFUSED,
    NOT_CONNECTED,

    // Treated as "no record found"
    LEDGER_ERROR,

    // API misuse
    INVALID_ARGUMENT,
    NOT_FOUND,
    INVALID_STATE,
    DUPLICATE_JOB,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR
};

const char* to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

}
