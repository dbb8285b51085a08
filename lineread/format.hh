#ifndef LINEREAD_FORMAT__
#define LINEREAD_FORMAT__

#include <cstddef>
#include <iosfwd>
#include <string>

namespace lineread {

// Compression container of a file, decided once from its name.
enum Format {
  kNone,
  kGzip,
  kBzip2,
  kXz,
  kLzma
};

// Classify by suffix: .gz, .bz2, .xz, .lzma.  Everything else, including
// the empty name used for descriptors, is kNone.
Format DetectFormat(const std::string &path);

/* Bytes per chunk when the caller doesn't say.  Uncompressed files get the
 * biggest chunks since there is no decompression to keep up with; formats
 * that are expensive to decode per read get smaller ones.
 */
std::size_t DefaultChunkSize(Format format);

const char *FormatName(Format format);

std::ostream &operator<<(std::ostream &out, Format format);

} // namespace lineread

#endif // LINEREAD_FORMAT__
