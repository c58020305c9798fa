#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"
#include "status.hpp"
#include "events.hpp"

/*
-------------------------------------------------------------------------------
 certificates.hpp — Certificate issuer
-------------------------------------------------------------------------------
Two issuing paths write the certificates table:

  - Automatic Completion: CertificateIssuer observes ProgressChanged and
    issues only on a crossing (old < threshold && new >= threshold), after
    checking that the pair has no Completion yet. A pair that stays above
    the threshold on later updates never gets a second one.
  - Awards (Excellence, Proficiency): cert_issue_award, called by an
    external decision. Idempotent per (pair, type).

A unique index on (student, course, type) backs both checks in storage.

Issued certificates are collected by the issuer and handed to the listener
by the engine once the transaction has committed.
-------------------------------------------------------------------------------
*/

/// The crossing condition.
inline bool crossed_threshold(double old_pct, double new_pct, double threshold) {
    return old_pct < threshold && new_pct >= threshold;
}

/// Deterministic reference: the same inputs give the same URL, and any
/// change of student, course, type or second gives a different one.
std::string make_certificate_url(const std::string& student_id, const std::string& course_id,
    CertificateType type, TimePoint issued_at);

/// found=false (status Ok) when the pair has no certificate of that type.
EngineStatus cert_find(sqlite3* db, const std::string& student_id,
    const std::string& course_id, CertificateType type, bool& found, Certificate& out);

/// Insert as-is. The caller has already checked for an existing row.
EngineStatus cert_insert(sqlite3* db, const Certificate& cert);

EngineStatus cert_list_for_student(sqlite3* db, const std::string& student_id,
    std::vector<Certificate>& out);

enum class AwardType { Excellence, Proficiency };

/// Issue an externally decided award. The pair must be enrolled or already
/// hold a Completion certificate, otherwise NotEnrolled. `created` is false
/// when the award existed; `out` is the stored certificate either way.
EngineStatus cert_issue_award(sqlite3* db, const std::string& student_id,
    const std::string& course_id, AwardType award, TimePoint now,
    bool& created, Certificate& out);

class CertificateIssuer : public ProgressObserver {
public:
    explicit CertificateIssuer(double threshold) : threshold_(threshold) {}

    EngineStatus on_progress_changed(sqlite3* db, const ProgressChanged& ev) override;

    /// Certificates created since construction, in issue order.
    const std::vector<Certificate>& issued() const { return issued_; }

private:
    double threshold_;
    std::vector<Certificate> issued_;
};
