#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"
#include "status.hpp"

/*
-------------------------------------------------------------------------------
 catalog.hpp — Course rows the engine reads
-------------------------------------------------------------------------------
The catalog belongs to the platform's course management; the engine only
needs price, lesson/assignment totals and duration. These helpers keep that
table populated for the console and the tests.

catalog_get_course is the read the engine performs inside its own
transactions (refund price, progress totals), so it takes the transaction's
connection and never opens one.
-------------------------------------------------------------------------------
*/

/// Non-negative price and totals, positive duration, non-empty code/title.
bool catalog_course_valid(const Course& c);

bool catalog_add_course(sqlite3* db, const Course& c);

/// Update title, price, totals and duration by code. False if not found.
bool catalog_update_course(sqlite3* db, const Course& c);

/// Delete by code; cascades to enrollments, progress, certificates, policy.
bool catalog_delete_course(sqlite3* db, const std::string& code);

/// UnknownCourse if the code is not in the catalog.
EngineStatus catalog_get_course(sqlite3* db, const std::string& code, Course& out);

bool catalog_list_courses(sqlite3* db, std::vector<Course>& out);
