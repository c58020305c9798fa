#pragma once
#include <string>
#include "models.hpp"
#include "status.hpp"

/*
-------------------------------------------------------------------------------
 events.hpp — Engine events and the interfaces that consume them
-------------------------------------------------------------------------------
ProgressChanged is produced by the progress accumulator and consumed
synchronously, inside the same transaction, by a ProgressObserver (the
certificate issuer). A non-Ok status from the observer aborts the whole
unit of work.

EngineListener is the outward surface: notification delivery and the revenue
ledger implement it. It is only called after the transaction has committed,
so a listener never sees an event whose effects were rolled back.
-------------------------------------------------------------------------------
*/

struct sqlite3;

struct ProgressChanged {
    std::string student_id;
    std::string course_id;
    double old_percentage{ 0.0 };
    double new_percentage{ 0.0 };
    TimePoint at{ 0 };
};

class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;

    /// Called with the open transaction's connection.
    virtual EngineStatus on_progress_changed(sqlite3* db, const ProgressChanged& ev) = 0;
};

class EngineListener {
public:
    virtual ~EngineListener() = default;

    virtual void on_certificate_issued(const Certificate& cert) = 0;
    virtual void on_dropout_recorded(const DropoutRecord& rec) = 0;
};
