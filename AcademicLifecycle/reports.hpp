#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "models.hpp"
#include "semester_gate.hpp"

/*
-------------------------------------------------------------------------------
 reports.hpp — Plain-text listings for the console
-------------------------------------------------------------------------------
Read-only formatting of engine records. Every printer writes to the given
stream so the console passes std::cout and tests pass a std::ostringstream.
Empty lists print a one-line notice instead of a header with no rows.
-------------------------------------------------------------------------------
*/

/// "2026-10-19" (UTC)
std::string format_date(TimePoint t);

void print_courses(std::ostream& os, const std::vector<Course>& courses);
void print_enrollments(std::ostream& os, const std::vector<Enrollment>& rows);
void print_progress(std::ostream& os, const ProgressRecord& rec);
void print_certificates(std::ostream& os, const std::vector<Certificate>& certs);
void print_dropout(std::ostream& os, const DropoutRecord& rec);
void print_dropouts(std::ostream& os, const std::vector<DropoutRecord>& rows);
void print_decision(std::ostream& os, const AdvancementDecision& d);
