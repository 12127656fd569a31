#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace nassync {

class StringUtils {
public:
  static std::string trim(const std::string &s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    if (begin >= end)
      return "";
    return std::string(begin, end);
  }

  static std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
  }
};

} // namespace nassync
