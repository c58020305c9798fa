#pragma once

/*
-------------------------------------------------------------------------------
 status.hpp — Result codes for engine operations
-------------------------------------------------------------------------------
Every engine operation returns an EngineStatus and writes its result through
an out-parameter, the same way the persistence layer returns success/failure.

Caller-facing kinds (NotEnrolled, AlreadyEnrolled, NoPolicyDefined,
UnknownCourse) carry an actionable message. InvariantViolation and
StorageError are internal faults: the transaction is rolled back and the
caller only sees an opaque message. Busy is transient and safe to retry.
-------------------------------------------------------------------------------
*/

enum class EngineStatus {
    Ok,
    NotEnrolled,
    AlreadyEnrolled,
    NoPolicyDefined,
    UnknownCourse,
    InvariantViolation,
    Busy,
    StorageError
};

/// Short user-visible message for a status.
const char* status_message(EngineStatus s);

/// Enum spelling, for logs.
const char* status_name(EngineStatus s);

/// True for Busy: the same call may be retried unchanged.
inline bool is_retryable(EngineStatus s) { return s == EngineStatus::Busy; }
