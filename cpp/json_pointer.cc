/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/json_pointer.cc
 */
#include "json_pointer.h"

namespace xschema {

std::string EscapeJSONPointerToken(const std::string& token) {
  std::string result;
  for (char c : token) {
    if (c == '~') {
      result += "~0";
    } else if (c == '/') {
      result += "~1";
    } else {
      result += c;
    }
  }
  return result;
}

std::string JSONPointerFromTokens(const std::vector<std::string>& tokens) {
  std::string result;
  for (const auto& token : tokens) {
    result += "/" + EscapeJSONPointerToken(token);
  }
  return result;
}

Result<std::vector<std::string>> JSONPointerTokens(const std::string& pointer) {
  std::vector<std::string> tokens;
  if (pointer.empty()) return ResultOk(std::move(tokens));
  if (pointer[0] != '/') {
    return ResultErr("JSON Pointer " + Quote(pointer) + " does not start with '/'");
  }
  std::string token;
  for (size_t i = 1; i <= pointer.size(); ++i) {
    if (i == pointer.size() || pointer[i] == '/') {
      tokens.push_back(std::move(token));
      token.clear();
      continue;
    }
    if (pointer[i] != '~') {
      token += pointer[i];
      continue;
    }
    if (i + 1 < pointer.size() && (pointer[i + 1] == '0' || pointer[i + 1] == '1')) {
      token += pointer[i + 1] == '0' ? '~' : '/';
      ++i;
      continue;
    }
    return ResultErr("invalid escape in JSON Pointer " + Quote(pointer));
  }
  return ResultOk(std::move(tokens));
}

const picojson::value* LookupJSONPointer(
    const picojson::value& root, const std::vector<std::string>& tokens
) {
  const picojson::value* current = &root;
  for (const auto& token : tokens) {
    if (current->is<picojson::object>()) {
      const auto& obj = current->get<picojson::object>();
      auto it = obj.find(token);
      if (it == obj.end()) return nullptr;
      current = &it->second;
    } else if (current->is<picojson::array>()) {
      const auto& arr = current->get<picojson::array>();
      if (token.empty() || (token.size() > 1 && token[0] == '0')) return nullptr;
      size_t index = 0;
      for (char c : token) {
        if (c < '0' || c > '9') return nullptr;
        index = index * 10 + static_cast<size_t>(c - '0');
        if (index > arr.size()) return nullptr;
      }
      if (index >= arr.size()) return nullptr;
      current = &arr[index];
    } else {
      return nullptr;
    }
  }
  return current;
}

}  // namespace xschema
