#pragma once
#include <string>

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool iequals(const std::string& a, const std::string& b);
bool starts_with_ci(const std::string& s, const std::string& prefix);

// Ordering for maps keyed by file path, matching paths regardless of case.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};
