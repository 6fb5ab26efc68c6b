/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/regexp_syntax.cc
 */
#include "regexp_syntax.h"

#include <cctype>
#include <cstring>
#include <unordered_set>

namespace xschema {

namespace {

/*!
 * \brief A single pass over an RE2 pattern that tracks groups, repetition and classes.
 */
class RegexpSyntaxChecker {
 public:
  explicit RegexpSyntaxChecker(const std::string& pattern) : pattern_(pattern) {}

  RegexpCheck Check() {
    while (pos_ < pattern_.size() && result_.status == RegexpStatus::kOk) {
      char c = pattern_[pos_];
      switch (c) {
        case '(':
          ParseGroupStart();
          break;
        case ')':
          if (depth_ == 0) return Fail(RegexpStatus::kInvalid, "unexpected )", pattern_);
          --depth_;
          ++pos_;
          Atom();
          break;
        case '|':
          ++pos_;
          can_repeat_ = false;
          last_repeat_ = false;
          break;
        case '^':
        case '$':
          ++pos_;
          can_repeat_ = false;
          last_repeat_ = false;
          break;
        case '*':
        case '+':
        case '?':
          ParseRepeat(pos_, pos_ + 1);
          break;
        case '{': {
          size_t end = 0;
          if (ParseRepeatCount(&end)) {
            ParseRepeat(pos_, end);
          } else {
            ++pos_;
            Atom();
          }
          break;
        }
        case '[':
          ParseClass();
          break;
        case '\\':
          ParseEscape(false);
          Atom();
          break;
        default:
          ++pos_;
          Atom();
      }
    }
    if (result_.status == RegexpStatus::kOk && depth_ > 0) {
      return Fail(RegexpStatus::kInvalid, "missing closing )", pattern_);
    }
    return result_;
  }

 private:
  RegexpCheck Fail(RegexpStatus status, const std::string& what, const std::string& text) {
    if (result_.status == RegexpStatus::kOk) {
      result_.status = status;
      result_.message = "error parsing regexp: " + what + ": `" + text + "`";
    }
    return result_;
  }

  void Atom() {
    can_repeat_ = true;
    last_repeat_ = false;
    lazy_used_ = false;
  }

  void ParseGroupStart() {
    size_t start = pos_;
    ++pos_;
    if (pos_ < pattern_.size() && pattern_[pos_] == '?') {
      ++pos_;
      if (pos_ >= pattern_.size()) {
        Fail(RegexpStatus::kInvalid, "missing closing )", pattern_.substr(start));
        return;
      }
      char c = pattern_[pos_];
      if (c == 'P' || c == '<') {
        if (c == 'P') ++pos_;
        if (pos_ >= pattern_.size() || pattern_[pos_] != '<' ||
            (pos_ + 1 < pattern_.size() && (pattern_[pos_ + 1] == '=' || pattern_[pos_ + 1] == '!'))) {
          Fail(RegexpStatus::kUnsupported, "invalid or unsupported Perl syntax", pattern_.substr(start, pos_ + 2 - start));
          return;
        }
        size_t close = pattern_.find('>', pos_);
        if (close == std::string::npos) {
          Fail(RegexpStatus::kUnsupported, "invalid named capture", pattern_.substr(start));
          return;
        }
        std::string name = pattern_.substr(pos_ + 1, close - pos_ - 1);
        bool valid = !name.empty();
        for (unsigned char ch : name) valid = valid && (std::isalnum(ch) || ch == '_');
        if (!valid) {
          Fail(RegexpStatus::kUnsupported, "invalid named capture", pattern_.substr(start, close + 1 - start));
          return;
        }
        pos_ = close + 1;
        ++depth_;
        can_repeat_ = false;
        return;
      }
      // Flags: (?flags) or (?flags:re)
      size_t flags_start = pos_;
      while (pos_ < pattern_.size() && std::strchr("imsU-", pattern_[pos_]) != nullptr) ++pos_;
      if (pos_ < pattern_.size() && pattern_[pos_] == ':') {
        ++pos_;
        ++depth_;
        can_repeat_ = false;
        return;
      }
      if (pos_ < pattern_.size() && pattern_[pos_] == ')' && pos_ > flags_start) {
        ++pos_;
        can_repeat_ = false;
        return;
      }
      Fail(
          RegexpStatus::kUnsupported,
          "invalid or unsupported Perl syntax",
          pattern_.substr(start, pos_ + 1 - start)
      );
      return;
    }
    ++depth_;
    can_repeat_ = false;
    last_repeat_ = false;
  }

  bool ParseRepeatCount(size_t* end) {
    size_t i = pos_ + 1;
    auto parse_int = [&](int* value) {
      size_t begin = i;
      *value = 0;
      while (i < pattern_.size() && std::isdigit(static_cast<unsigned char>(pattern_[i]))) {
        if (*value <= 100000) *value = *value * 10 + (pattern_[i] - '0');
        ++i;
      }
      return i > begin;
    };
    int min = 0;
    int max = -1;
    if (!parse_int(&min)) return false;
    if (i < pattern_.size() && pattern_[i] == ',') {
      ++i;
      if (i < pattern_.size() && pattern_[i] != '}') {
        if (!parse_int(&max)) return false;
      }
    } else {
      max = min;
    }
    if (i >= pattern_.size() || pattern_[i] != '}') return false;
    *end = i + 1;
    if (min > 1000 || max > 1000 || (max >= 0 && min > max)) {
      Fail(RegexpStatus::kInvalid, "invalid repeat count", pattern_.substr(pos_, *end - pos_));
    }
    return true;
  }

  void ParseRepeat(size_t start, size_t end) {
    std::string op = pattern_.substr(start, end - start);
    if (last_repeat_) {
      if (op == "?" && !lazy_used_) {
        lazy_used_ = true;
        pos_ = end;
        return;
      }
      Fail(RegexpStatus::kInvalid, "invalid nested repetition operator", op);
      return;
    }
    if (!can_repeat_) {
      Fail(RegexpStatus::kInvalid, "missing argument to repetition operator", op);
      return;
    }
    last_repeat_ = true;
    lazy_used_ = false;
    pos_ = end;
  }

  // Parses an escape at pos_; returns the code point for single characters, or -1.
  int ParseEscape(bool in_class) {
    size_t start = pos_;
    ++pos_;
    if (pos_ >= pattern_.size()) {
      Fail(RegexpStatus::kInvalid, "trailing backslash at end of expression", "");
      return -1;
    }
    char c = pattern_[pos_++];
    if (c >= '1' && c <= '9') {
      Fail(RegexpStatus::kUnsupported, "invalid escape sequence", pattern_.substr(start, 2));
      return -1;
    }
    if (c == '0') {
      int value = 0;
      for (int n = 0; n < 2 && pos_ < pattern_.size() && pattern_[pos_] >= '0' && pattern_[pos_] <= '7'; ++n) {
        value = value * 8 + (pattern_[pos_++] - '0');
      }
      return value;
    }
    if (!std::isalnum(static_cast<unsigned char>(c))) return static_cast<unsigned char>(c);
    switch (c) {
      case 'a':
        return 7;
      case 'f':
        return '\f';
      case 't':
        return '\t';
      case 'n':
        return '\n';
      case 'r':
        return '\r';
      case 'v':
        return '\v';
      case 'd':
      case 'D':
      case 's':
      case 'S':
      case 'w':
      case 'W':
        return -1;
      case 'b':
      case 'B':
      case 'A':
      case 'z':
        if (in_class) break;
        return -1;
      case 'Q': {
        if (in_class) break;
        size_t quote_end = pattern_.find("\\E", pos_);
        pos_ = quote_end == std::string::npos ? pattern_.size() : quote_end + 2;
        return -1;
      }
      case 'p':
      case 'P': {
        if (pos_ >= pattern_.size()) break;
        if (pattern_[pos_] == '{') {
          size_t close = pattern_.find('}', pos_);
          if (close == std::string::npos) break;
          pos_ = close + 1;
        } else {
          ++pos_;
        }
        return -1;
      }
      case 'x': {
        if (pos_ < pattern_.size() && pattern_[pos_] == '{') {
          size_t close = pattern_.find('}', pos_);
          if (close == std::string::npos || close == pos_ + 1) break;
          int value = 0;
          for (size_t i = pos_ + 1; i < close; ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(pattern_[i]))) return BadEscape(start);
            value = value * 16 + HexDigit(pattern_[i]);
            if (value > 0x10FFFF) return BadEscape(start);
          }
          pos_ = close + 1;
          return value;
        }
        if (pos_ + 1 < pattern_.size() && std::isxdigit(static_cast<unsigned char>(pattern_[pos_])) &&
            std::isxdigit(static_cast<unsigned char>(pattern_[pos_ + 1]))) {
          int value = HexDigit(pattern_[pos_]) * 16 + HexDigit(pattern_[pos_ + 1]);
          pos_ += 2;
          return value;
        }
        break;
      }
      default:
        break;
    }
    return BadEscape(start);
  }

  int BadEscape(size_t start) {
    Fail(RegexpStatus::kUnsupported, "invalid escape sequence", pattern_.substr(start, pos_ - start));
    return -1;
  }

  static int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
  }

  void ParseClass() {
    static const std::unordered_set<std::string> kClassNames = {
        "alnum", "alpha", "ascii", "blank", "cntrl", "digit", "graph",
        "lower", "print", "punct", "space", "upper", "word",  "xdigit",
    };
    size_t start = pos_;
    ++pos_;
    if (pos_ < pattern_.size() && pattern_[pos_] == '^') ++pos_;
    bool first = true;
    while (pos_ < pattern_.size() && result_.status == RegexpStatus::kOk) {
      char c = pattern_[pos_];
      if (c == ']' && !first) {
        ++pos_;
        Atom();
        return;
      }
      first = false;
      if (c == '[' && pos_ + 1 < pattern_.size() && pattern_[pos_ + 1] == ':') {
        size_t close = pattern_.find(":]", pos_ + 2);
        if (close != std::string::npos) {
          std::string name = pattern_.substr(pos_ + 2, close - pos_ - 2);
          if (!name.empty() && name[0] == '^') name = name.substr(1);
          if (kClassNames.count(name) == 0) {
            Fail(
                RegexpStatus::kUnsupported,
                "invalid character class range",
                pattern_.substr(pos_, close + 2 - pos_)
            );
            return;
          }
          pos_ = close + 2;
          continue;
        }
      }
      size_t lo_start = pos_;
      int lo = ClassChar();
      if (lo < 0) continue;
      if (pos_ + 1 < pattern_.size() && pattern_[pos_] == '-' && pattern_[pos_ + 1] != ']') {
        ++pos_;
        int hi = ClassChar();
        if (hi < 0) {
          if (result_.status == RegexpStatus::kOk) {
            Fail(
                RegexpStatus::kUnsupported,
                "invalid character class range",
                pattern_.substr(lo_start, pos_ - lo_start)
            );
          }
          return;
        }
        if (hi < lo) {
          Fail(
              RegexpStatus::kUnsupported,
              "invalid character class range",
              pattern_.substr(lo_start, pos_ - lo_start)
          );
          return;
        }
      }
    }
    if (result_.status == RegexpStatus::kOk) {
      Fail(RegexpStatus::kInvalid, "missing closing ]", pattern_.substr(start));
    }
  }

  // Reads one class member; returns its code point, or -1 for escapes that denote a set.
  int ClassChar() {
    if (pattern_[pos_] == '\\') return ParseEscape(true);
    unsigned char c = static_cast<unsigned char>(pattern_[pos_]);
    if (c < 0x80) {
      ++pos_;
      return c;
    }
    // Decode a UTF-8 sequence so that ranges of non-ASCII characters compare correctly.
    int length = c >= 0xF0 ? 4 : c >= 0xE0 ? 3 : c >= 0xC0 ? 2 : 1;
    int value = length == 4 ? (c & 0x07) : length == 3 ? (c & 0x0F) : length == 2 ? (c & 0x1F) : c;
    ++pos_;
    for (int i = 1; i < length && pos_ < pattern_.size(); ++i, ++pos_) {
      value = (value << 6) | (static_cast<unsigned char>(pattern_[pos_]) & 0x3F);
    }
    return value;
  }

  const std::string& pattern_;
  size_t pos_ = 0;
  int depth_ = 0;
  bool can_repeat_ = false;
  bool last_repeat_ = false;
  bool lazy_used_ = false;
  RegexpCheck result_;
};

}  // namespace

RegexpCheck CheckRegexpSyntax(const std::string& pattern) {
  return RegexpSyntaxChecker(pattern).Check();
}

std::string QuoteMeta(const std::string& text) {
  static const char* kSpecial = "\\.+*?()|[]{}^$";
  std::string result;
  for (char c : text) {
    if (std::strchr(kSpecial, c) != nullptr && c != '\0') result += '\\';
    result += c;
  }
  return result;
}

}  // namespace xschema
