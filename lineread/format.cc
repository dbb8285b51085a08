#include "lineread/format.hh"

#include <ostream>

#include <string.h>

namespace lineread {

namespace {

const std::size_t kMB = 1024 * 1024;

struct Suffix {
  const char *ending;
  Format format;
};

const Suffix kSuffixes[] = {
  {".gz", kGzip},
  {".bz2", kBzip2},
  {".xz", kXz},
  {".lzma", kLzma}
};

bool EndsWith(const std::string &str, const char *ending) {
  std::size_t length = strlen(ending);
  return str.size() >= length && !str.compare(str.size() - length, length, ending);
}

} // namespace

Format DetectFormat(const std::string &path) {
  for (const Suffix *i = kSuffixes; i != kSuffixes + sizeof(kSuffixes) / sizeof(Suffix); ++i) {
    if (EndsWith(path, i->ending)) return i->format;
  }
  return kNone;
}

std::size_t DefaultChunkSize(Format format) {
  switch (format) {
    case kNone:
      return 128 * kMB;
    case kGzip:
      return 32 * kMB;
    case kBzip2:
      return 16 * kMB;
    case kXz:
    case kLzma:
      return 32 * kMB;
  }
  return 16 * kMB;
}

const char *FormatName(Format format) {
  switch (format) {
    case kNone:
      return "none";
    case kGzip:
      return "gzip";
    case kBzip2:
      return "bzip2";
    case kXz:
      return "xz";
    case kLzma:
      return "lzma";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &out, Format format) {
  return out << FormatName(format);
}

} // namespace lineread
