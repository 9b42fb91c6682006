#include "sim_status.h"

const char* simErrorCodeName(SimErrorCode code) {
    switch (code) {
        case SimErrorCode::None: return "None";
        case SimErrorCode::OutOfBounds: return "OutOfBounds";
        case SimErrorCode::RegionOccupied: return "RegionOccupied";
        case SimErrorCode::NotFound: return "NotFound";
        case SimErrorCode::UnknownType: return "UnknownType";
        case SimErrorCode::InvalidState: return "InvalidState";
        case SimErrorCode::InvalidAmount: return "InvalidAmount";
        case SimErrorCode::MalformedResources: return "MalformedResources";
        case SimErrorCode::InsufficientResources: return "InsufficientResources";
        case SimErrorCode::SchemaMismatch: return "SchemaMismatch";
        case SimErrorCode::ParseError: return "ParseError";
    }
    return "Unknown";
}
