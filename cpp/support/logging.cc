/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/support/logging.cc
 */
#include "logging.h"

#include <iostream>

namespace xschema {

namespace {

const char* LevelName(int level) {
  switch (level) {
    case LogMessage::kDebug:
      return "DEBUG";
    case LogMessage::kInfo:
      return "INFO";
    case LogMessage::kWarning:
      return "WARNING";
    default:
      return "UNKNOWN";
  }
}

}  // namespace

LogMessage::LogMessage(const std::string& file, int lineno, int level) {
  stream_ << "[" << LevelName(level) << "] " << file << ":" << lineno << ": ";
}

LogMessage::~LogMessage() { std::cerr << stream_.str() << std::endl; }

}  // namespace xschema
