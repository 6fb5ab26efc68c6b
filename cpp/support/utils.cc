/*!
 * Copyright (c) 2024 by Contributors
 * \file xschema/support/utils.cc
 */
#include "utils.h"

#include <cstdio>

namespace xschema {

std::string Quote(const std::string& str) {
  std::string result = "\"";
  for (unsigned char c : str) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  result += "\"";
  return result;
}

std::string Join(const std::vector<std::string>& strs, const std::string& sep) {
  std::string result;
  for (size_t i = 0; i < strs.size(); ++i) {
    if (i != 0) result += sep;
    result += strs[i];
  }
  return result;
}

}  // namespace xschema
