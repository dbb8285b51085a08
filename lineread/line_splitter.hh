#ifndef LINEREAD_LINE_SPLITTER__
#define LINEREAD_LINE_SPLITTER__

#include <boost/utility/string_ref.hpp>

#include <cstddef>
#include <string>

#include <stdint.h>

namespace lineread {

class ChunkSource;
class Decoder;

/* Pulls chunks from a ChunkSource, decodes them onto a pending buffer, and
 * returns the buffer one '\n'-terminated line at a time.  Text after the
 * last '\n' waits in the buffer for the next chunk; at the end of the stream
 * it is returned as the final line if it isn't empty.
 *
 * The splitter owns the pending buffer and is the only thing that changes
 * it.  One splitter serves one pass over one source.
 */
class LineSplitter {
  public:
    // With strip_cr, a '\r' right before '\n' is dropped too.
    LineSplitter(ChunkSource &source, Decoder &decoder, bool strip_cr = false);

    // Memory backing line may vanish on the next call.  False at the end.
    bool Next(boost::string_ref &line);

    // Bytes of non-empty chunks pulled from the source so far.
    uint64_t BytesConsumed() const { return bytes_; }

    // Decoded text still waiting for a line terminator.
    std::size_t Pending() const { return pending_.size() - position_; }

  private:
    // Grow pending_ by one more chunk, or flush the decoder at the end.
    void Refill();

    ChunkSource &source_;
    Decoder &decoder_;
    const bool strip_cr_;

    // UTF-8 text.  Everything before position_ has been returned.
    std::string pending_;
    std::size_t position_;
    // Bytes from position_ already known to hold no '\n'.
    std::size_t scanned_;

    std::string chunk_;

    uint64_t bytes_;

    bool at_end_;
};

} // namespace lineread

#endif // LINEREAD_LINE_SPLITTER__
