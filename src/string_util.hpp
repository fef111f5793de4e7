#pragma once

#include <string>

class StringUtil {
public:
    static std::string to_lower(const std::string& s);

    // Every whitespace run becomes a single space; leading and trailing runs are dropped.
    static std::string collapse_whitespace(const std::string& s);
};
