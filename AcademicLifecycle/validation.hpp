#pragma once
#include <string>
#include <regex>
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <cctype>   // for std::isspace

/*
-------------------------------------------------------------------------------
 validation.hpp - Input validation and console prompt helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - trim: basic whitespace trimming helper.
  - Validators: student id, course code, lesson/assignment id, title, reason.
  - Prompt helpers for the interactive console:
      * prompt_until_valid_or_back    -> loop until validator passes, Back/Exit
      * prompt_number_or_back         -> numeric with range and Back/Exit
      * prompt_int_or_back            -> whole number with range and Back/Exit
      * confirm_or_back               -> yes/no confirmation (Back on no)

Conventions:
  - Special inputs:
      Back: "b", "B"
      Exit: "x", "X", "q", "Q"
    ("0" is a legitimate number for credits and prices, so it is not Back.)
  - All characters are plain ASCII.
-------------------------------------------------------------------------------
*/

// Trim leading and trailing whitespace.
inline std::string trim(std::string s) {
    auto ws = [](int ch) { return std::isspace(ch); };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

// e.g. S001, S12345  (S + 3-6 digits)
inline bool is_valid_student_id(const std::string& x) {
    static const std::regex re("^S\\d{3,6}$");
    return std::regex_match(x, re);
}

// 3 letters + 3 digits, e.g. DSA101, CSE100
inline bool is_valid_course_code(const std::string& x) {
    static const std::regex re("^[A-Z]{3}\\d{3}$");
    return std::regex_match(x, re);
}

// lesson / assignment ids: letters, digits, '-', '_'; 1..20 chars
inline bool is_valid_item_id(const std::string& x) {
    static const std::regex re("^[A-Za-z0-9_\\-]{1,20}$");
    return std::regex_match(x, re);
}

// non-empty, max 60
inline bool is_non_empty_short(const std::string& x) {
    return !trim(x).empty() && x.size() <= 60;
}

// withdrawal reason: may be empty, max 120
inline bool is_valid_reason(const std::string& x) {
    return x.size() <= 120;
}

inline bool is_back(const std::string& v) { return v == "b" || v == "B"; }
inline bool is_exit(const std::string& v) { return v == "x" || v == "X" || v == "q" || v == "Q"; }

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

// String prompt that accepts Back/Exit keywords. EOF on stdin counts as Exit.
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg)
{
    for (;;) {
        std::string v;
        std::cout << label << " (b=Back, x=Exit): ";
        if (!std::getline(std::cin, v)) return InputCtl::Exit;
        v = trim(v);
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Number prompt with range + Back/Exit
inline InputCtl prompt_number_or_back(
    const std::string& label,
    double& out,
    double lo, double hi)
{
    for (;;) {
        std::string v;
        std::cout << label << " [" << lo << "-" << hi << "] (b=Back, x=Exit): ";
        if (!std::getline(std::cin, v)) return InputCtl::Exit;
        v = trim(v);
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        try {
            size_t used = 0;
            double d = std::stod(v, &used);
            if (used != v.size()) throw std::invalid_argument(v);
            if (d < lo || d > hi) { std::cout << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
            out = d; return InputCtl::Ok;
        }
        catch (const std::exception&) {
            std::cout << "  -> Please enter a number.\n";
        }
    }
}

// Whole-number prompt with range + Back/Exit. "2.7" or "9.5" is re-asked,
// never truncated.
inline InputCtl prompt_int_or_back(
    const std::string& label,
    int& out,
    int lo, int hi)
{
    for (;;) {
        std::string v;
        std::cout << label << " [" << lo << "-" << hi << "] (b=Back, x=Exit): ";
        if (!std::getline(std::cin, v)) return InputCtl::Exit;
        v = trim(v);
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        try {
            size_t used = 0;
            long n = std::stol(v, &used);
            if (used != v.size()) throw std::invalid_argument(v);
            if (n < lo || n > hi) { std::cout << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
            out = static_cast<int>(n); return InputCtl::Ok;
        }
        catch (const std::exception&) {
            std::cout << "  -> Please enter a whole number.\n";
        }
    }
}

// Yes/No confirmation. Empty or "n" is treated as cancel (Back).
inline InputCtl confirm_or_back(const std::string& msg) {
    for (;;) {
        std::string v;
        std::cout << msg << " [y/N] (x=Exit): ";
        if (!std::getline(std::cin, v)) return InputCtl::Exit;
        v = trim(v);
        if (v.empty() || v == "n" || v == "N") return InputCtl::Back; // treat as cancel
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (v == "y" || v == "Y") return InputCtl::Ok;
        std::cout << "  -> Please enter y or n.\n";
    }
}
