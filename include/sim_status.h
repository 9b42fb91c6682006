#pragma once

#include <string>
#include <utility>

enum class SimErrorCode {
    None = 0,
    OutOfBounds,
    RegionOccupied,
    NotFound,
    UnknownType,
    InvalidState,
    InvalidAmount,
    MalformedResources,
    InsufficientResources,
    SchemaMismatch,
    ParseError
};

const char* simErrorCodeName(SimErrorCode code);

// Outcome of a rejected-input operation. Expected shortfalls are reported
// through the operation's own result fields instead.
struct SimStatus {
    SimErrorCode code = SimErrorCode::None;
    std::string message;

    bool ok() const { return code == SimErrorCode::None; }

    static SimStatus success() { return SimStatus{}; }
    static SimStatus failure(SimErrorCode c, std::string msg) { return SimStatus{c, std::move(msg)}; }
};
