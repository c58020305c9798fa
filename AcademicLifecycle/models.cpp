#include "models.hpp"
#include "status.hpp"

const char* certificate_type_name(CertificateType t) {
    switch (t) {
    case CertificateType::Completion:  return "Completion";
    case CertificateType::Excellence:  return "Excellence";
    case CertificateType::Proficiency: return "Proficiency";
    }
    return "Completion";
}

bool parse_certificate_type(const std::string& text, CertificateType& out) {
    if (text == "Completion") { out = CertificateType::Completion; return true; }
    if (text == "Excellence") { out = CertificateType::Excellence; return true; }
    if (text == "Proficiency") { out = CertificateType::Proficiency; return true; }
    return false;
}

const char* status_message(EngineStatus s) {
    switch (s) {
    case EngineStatus::Ok:                 return "ok";
    case EngineStatus::NotEnrolled:        return "not currently enrolled";
    case EngineStatus::AlreadyEnrolled:    return "already enrolled in this course";
    case EngineStatus::NoPolicyDefined:    return "no advancement policy defined";
    case EngineStatus::UnknownCourse:      return "course not found in catalog";
    case EngineStatus::Busy:               return "busy, try again";
    case EngineStatus::InvariantViolation:
    case EngineStatus::StorageError:       return "internal error";
    }
    return "internal error";
}

const char* status_name(EngineStatus s) {
    switch (s) {
    case EngineStatus::Ok:                 return "Ok";
    case EngineStatus::NotEnrolled:        return "NotEnrolled";
    case EngineStatus::AlreadyEnrolled:    return "AlreadyEnrolled";
    case EngineStatus::NoPolicyDefined:    return "NoPolicyDefined";
    case EngineStatus::UnknownCourse:      return "UnknownCourse";
    case EngineStatus::InvariantViolation: return "InvariantViolation";
    case EngineStatus::Busy:               return "Busy";
    case EngineStatus::StorageError:       return "StorageError";
    }
    return "StorageError";
}
