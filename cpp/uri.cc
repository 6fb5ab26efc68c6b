/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/uri.cc
 */
#include "uri.h"

#include <cctype>
#include <cstdint>
#include <vector>

namespace xschema {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

Result<std::string> Unescape(const std::string& text) {
  std::string result;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      result += text[i];
      continue;
    }
    if (i + 2 >= text.size()) {
      return ResultErr("invalid URL escape " + Quote(text.substr(i)));
    }
    int hi = HexValue(text[i + 1]);
    int lo = HexValue(text[i + 2]);
    if (hi < 0 || lo < 0) {
      return ResultErr("invalid URL escape " + Quote(text.substr(i, 3)));
    }
    result += static_cast<char>(hi * 16 + lo);
    i += 2;
  }
  return ResultOk(std::move(result));
}

bool IsFragmentChar(unsigned char c) {
  if (std::isalnum(c)) return true;
  switch (c) {
    case '-':
    case '.':
    case '_':
    case '~':
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case ';':
    case '=':
    case ':':
    case '@':
    case '/':
    case '?':
      return true;
    default:
      return false;
  }
}

std::string EscapeFragment(const std::string& fragment) {
  static const char* kHex = "0123456789ABCDEF";
  std::string result;
  for (unsigned char c : fragment) {
    if (IsFragmentChar(c)) {
      result += static_cast<char>(c);
    } else {
      result += '%';
      result += kHex[c >> 4];
      result += kHex[c & 15];
    }
  }
  return result;
}

std::string RemoveDotSegments(const std::string& path) {
  if (path.empty()) return path;
  std::vector<std::string> output;
  size_t start = 0;
  bool absolute = path[0] == '/';
  if (absolute) start = 1;
  std::string last;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    std::string segment = path.substr(start, end - start);
    last = segment;
    if (segment == "..") {
      if (!output.empty()) output.pop_back();
    } else if (segment != ".") {
      output.push_back(segment);
    }
    start = end + 1;
  }
  std::string result = absolute ? "/" : "";
  result += Join(output, "/");
  // A trailing "." or ".." leaves a directory path.
  if ((last == "." || last == "..") && !output.empty()) result += "/";
  return result;
}

}  // namespace

Result<URI> URI::Parse(const std::string& text) {
  URI uri;
  std::string rest = text;

  size_t hash = rest.find('#');
  if (hash != std::string::npos) {
    auto fragment = Unescape(rest.substr(hash + 1));
    if (fragment.IsErr()) return ResultErr(std::move(fragment).UnwrapErr());
    uri.has_fragment_ = true;
    uri.fragment_ = std::move(fragment).Unwrap();
    rest = rest.substr(0, hash);
  }

  size_t colon = rest.find(':');
  size_t delim = rest.find_first_of("/?");
  if (colon != std::string::npos && (delim == std::string::npos || colon < delim)) {
    std::string scheme = rest.substr(0, colon);
    if (scheme.empty()) {
      return ResultErr("missing protocol scheme in " + Quote(text));
    }
    bool valid = std::isalpha(static_cast<unsigned char>(scheme[0]));
    for (char c : scheme) {
      valid = valid && (std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
                        c == '.');
    }
    if (valid) {
      uri.scheme_ = scheme;
      for (auto& c : uri.scheme_) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      rest = rest.substr(colon + 1);
      if (!rest.empty() && rest[0] != '/') {
        uri.opaque_ = rest;
        return ResultOk(std::move(uri));
      }
    } else {
      return ResultErr("first path segment in URL cannot contain colon: " + Quote(text));
    }
  }

  if (StartsWith(rest, "//")) {
    size_t end = rest.find_first_of("/?", 2);
    if (end == std::string::npos) end = rest.size();
    uri.has_authority_ = true;
    uri.host_ = rest.substr(2, end - 2);
    rest = rest.substr(end);
  }

  size_t question = rest.find('?');
  if (question != std::string::npos) {
    uri.has_query_ = true;
    uri.query_ = rest.substr(question + 1);
    rest = rest.substr(0, question);
  }
  auto path = Unescape(rest);
  if (path.IsErr()) return ResultErr(std::move(path).UnwrapErr());
  uri.path_ = std::move(path).Unwrap();
  return ResultOk(std::move(uri));
}

URI URI::ResolveReference(const URI& ref) const {
  URI target;
  if (!ref.scheme_.empty()) {
    target = ref;
    target.path_ = RemoveDotSegments(ref.path_);
    return target;
  }
  target.scheme_ = scheme_;
  if (ref.has_authority_) {
    target.has_authority_ = true;
    target.host_ = ref.host_;
    target.path_ = RemoveDotSegments(ref.path_);
    target.has_query_ = ref.has_query_;
    target.query_ = ref.query_;
  } else {
    target.has_authority_ = has_authority_;
    target.host_ = host_;
    if (ref.path_.empty()) {
      target.path_ = path_;
      target.opaque_ = opaque_;
      target.has_query_ = ref.has_query_ || has_query_;
      target.query_ = ref.has_query_ ? ref.query_ : query_;
    } else {
      if (ref.path_[0] == '/') {
        target.path_ = RemoveDotSegments(ref.path_);
      } else if (has_authority_ && path_.empty()) {
        target.path_ = RemoveDotSegments("/" + ref.path_);
      } else {
        size_t slash = path_.rfind('/');
        std::string dir = slash == std::string::npos ? "" : path_.substr(0, slash + 1);
        target.path_ = RemoveDotSegments(dir + ref.path_);
      }
      target.has_query_ = ref.has_query_;
      target.query_ = ref.query_;
    }
  }
  target.has_fragment_ = ref.has_fragment_;
  target.fragment_ = ref.fragment_;
  return target;
}

URI URI::WithoutFragment() const {
  URI uri = *this;
  uri.has_fragment_ = false;
  uri.fragment_.clear();
  return uri;
}

URI URI::WithFragment(const std::string& fragment) const {
  URI uri = *this;
  uri.has_fragment_ = true;
  uri.fragment_ = fragment;
  return uri;
}

std::string URI::String() const {
  std::string result;
  if (!scheme_.empty()) result += scheme_ + ":";
  if (!opaque_.empty()) {
    result += opaque_;
  } else {
    if (has_authority_) result += "//" + host_;
    result += path_;
  }
  if (has_query_) result += "?" + query_;
  if (has_fragment_) result += "#" + EscapeFragment(fragment_);
  return result;
}

std::string Base64RawURLEncode(const std::string& data) {
  static const char* kAlphabet =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
  std::string result;
  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                 (static_cast<unsigned char>(data[i + 1]) << 8) |
                 static_cast<unsigned char>(data[i + 2]);
    result += kAlphabet[(n >> 18) & 63];
    result += kAlphabet[(n >> 12) & 63];
    result += kAlphabet[(n >> 6) & 63];
    result += kAlphabet[n & 63];
  }
  size_t remaining = data.size() - i;
  if (remaining == 1) {
    uint32_t n = static_cast<unsigned char>(data[i]) << 16;
    result += kAlphabet[(n >> 18) & 63];
    result += kAlphabet[(n >> 12) & 63];
  } else if (remaining == 2) {
    uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                 (static_cast<unsigned char>(data[i + 1]) << 8);
    result += kAlphabet[(n >> 18) & 63];
    result += kAlphabet[(n >> 12) & 63];
    result += kAlphabet[(n >> 6) & 63];
  }
  return result;
}

}  // namespace xschema
