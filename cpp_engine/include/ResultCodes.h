#pragma once

namespace scout {

// Outcome of a fallible operation. Business outcomes (a search that fails,
// an unmet prerequisite, a missed roll) are never reported through this.
enum class ResultCode : int {
    Ok = 0,
    ConfigurationError, // unknown tier / quality / inspection id
    InsufficientFunds,
    NotFound,
    InvalidState,
    CorruptRecord,      // persisted entry skipped on load
    SpawnFailure,       // acquisition failed, charge refunded
    NoOpportunity,
    NotAuthoritative,   // mutation attempted on a replica
};

const char* toString(ResultCode code);

inline bool succeeded(ResultCode code) { return code == ResultCode::Ok; }

} // namespace scout
