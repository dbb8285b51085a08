#include "lineread/config.hh"

#include "lineread/exception.hh"

#include <iostream>
#include <sstream>

#include <ctype.h>

namespace lineread {

DecodeErrorPolicy ParseDecodeErrorPolicy(const std::string &name) {
  if (name == "strict") return kStrict;
  if (name == "replace") return kReplace;
  if (name == "ignore") return kIgnore;
  LINEREAD_THROW(ConfigurationException, "Unknown decode error policy " << name << "; expected strict, replace, or ignore.");
}

const char *DecodeErrorPolicyName(DecodeErrorPolicy policy) {
  switch (policy) {
    case kStrict:
      return "strict";
    case kReplace:
      return "replace";
    case kIgnore:
      return "ignore";
  }
  return "unknown";
}

uint64_t ParseSize(const std::string &arg) {
  std::istringstream stream(arg);
  double value;
  stream >> value;
  LINEREAD_THROW_IF(!stream || value < 0.0, ConfigurationException, "Could not parse size " << arg << " for the leading number.");
  std::string after;
  stream >> after;
  LINEREAD_THROW_IF(after.size() > 1, ConfigurationException, "Size " << arg << " has more than one character after the number.");
  if (after.empty()) after = "b";

  const std::string units("bKMGTPE");
  std::string::size_type index = units.find(after[0] == 'b' ? 'b' : static_cast<char>(toupper(static_cast<unsigned char>(after[0]))));
  LINEREAD_THROW_IF(index == std::string::npos, ConfigurationException, "Size " << arg << " has an unknown suffix; the allowed suffixes are " << units << '.');
  for (std::string::size_type i = 0; i < index; ++i) {
    value *= 1024.0;
  }
  return static_cast<uint64_t>(value);
}

Config::Config() :
  chunk_size(0),
  encoding("UTF-8"),
  errors(kReplace),
  strip_cr(false),
  debug(false),
  messages(&std::cerr),
  show_progress(NULL) {}

} // namespace lineread
