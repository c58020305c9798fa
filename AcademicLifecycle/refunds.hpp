#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"
#include "status.hpp"

/*
-------------------------------------------------------------------------------
 refunds.hpp — Dropout / refund processor
-------------------------------------------------------------------------------
Withdrawal writes one immutable DropoutRecord and removes the enrollment.
The refund is a step function of elapsed days over course duration:

    ratio <= 0.25  -> 90 %
    ratio <= 0.50  -> 50 %
    ratio <= 0.75  -> 25 %
    otherwise      ->  0 %

Ratios are compared in integer arithmetic (4 * completed <= total, ...), so
tier edges are exact. refund_amount = price * percentage / 100, rounded
half-up to the cent, with the price read on the withdrawing transaction.

refund_withdraw performs the reads and both writes on the caller's
transaction; the caller commits once, so the record and the deletion land
together or not at all.
-------------------------------------------------------------------------------
*/

/// Whole days between enrollment and dropout, clamped to [0, total_days].
int completed_days(TimePoint enrolled_at, TimePoint dropout_at, int total_days);

/// 90 / 50 / 25 / 0. total_days must be positive.
int refund_percentage_for(int completed, int total_days);

/// price * percentage / 100, half-up.
Cents refund_amount_for(Cents price_cents, int refund_percentage);

/// Derive every field of the record from its inputs. InvariantViolation if
/// the course duration or price is invalid or a derived value falls outside
/// its range.
EngineStatus build_dropout_record(const Enrollment& enrollment, const Course& course,
    TimePoint dropout_at, const std::string& reason, DropoutRecord& out);

/// Lookup, price read, insert record, delete enrollment. NotEnrolled when the
/// pair has no active enrollment.
EngineStatus refund_withdraw(sqlite3* db, const std::string& student_id,
    const std::string& course_id, const std::string& reason, TimePoint now,
    DropoutRecord& out);

/// Audit trail of one student, oldest first.
EngineStatus dropout_list_for_student(sqlite3* db, const std::string& student_id,
    std::vector<DropoutRecord>& out);

/// "900.00"
std::string format_cents(Cents amount);
