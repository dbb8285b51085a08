#ifndef LINEREAD_STATS__
#define LINEREAD_STATS__

#include <iosfwd>
#include <string>

#include <stdint.h>

namespace lineread {

// Snapshot of a reader's progress.  Values reflect completed work only.
struct Stats {
  Stats() : lines(0), bytes(0), seconds(0.0) {}

  // Base name of the file, or the name given for a descriptor.
  std::string file;

  // "compressed" or "buffered"; empty before reading starts.
  std::string strategy;

  uint64_t lines;

  // Decompressed bytes handed to the decoder.
  uint64_t bytes;

  // Wall time since reading started, frozen once the reader closes.
  double seconds;

  // Both are 0 when no time has elapsed.
  double LinesPerSecond() const;
  double MegabytesPerSecond() const;
};

// One line: file, strategy, lines, bytes, seconds, lines/s, MB/s.
std::ostream &operator<<(std::ostream &out, const Stats &stats);

} // namespace lineread

#endif // LINEREAD_STATS__
