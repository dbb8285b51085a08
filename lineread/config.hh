#ifndef LINEREAD_CONFIG__
#define LINEREAD_CONFIG__

#include <cstddef>
#include <iosfwd>
#include <string>

#include <stdint.h>

namespace lineread {

// What to do with bytes that are malformed in the configured encoding.
typedef enum {
  // Throw DecodeException and stop reading.
  kStrict,
  // Substitute U+FFFD (or the encoding's substitution character).
  kReplace,
  // Drop them.
  kIgnore
} DecodeErrorPolicy;

// Accepts "strict", "replace", or "ignore".  ConfigurationException otherwise.
DecodeErrorPolicy ParseDecodeErrorPolicy(const std::string &name);

const char *DecodeErrorPolicyName(DecodeErrorPolicy policy);

// Parse a size like unix sort: 64k, 4M, 1.5G.  Unlike sort, a bare number
// is bytes.  ConfigurationException on anything else.
uint64_t ParseSize(const std::string &arg);

struct Config {
  // Defaults to UTF-8 with replacement, chunk size picked by format.
  Config();

  // Bytes per chunk.  0 means DefaultChunkSize for the file's format.
  std::size_t chunk_size;

  // Any encoding name ICU knows: UTF-8, latin1, UTF-16LE, Shift_JIS, ...
  std::string encoding;

  DecodeErrorPolicy errors;

  // Remove '\r' before '\n' so CRLF files read like LF files.
  bool strip_cr;

  // Report the start and end of each pass with timing to messages.
  bool debug;

  // Where debug lines go.  Defaults to std::cerr.
  std::ostream *messages;

  // Draw a progress bar here for regular files.  NULL for none.
  std::ostream *show_progress;
};

} // namespace lineread

#endif // LINEREAD_CONFIG__
