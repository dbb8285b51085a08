#include "lineread/line_splitter.hh"

#include "lineread/chunk_source.hh"
#include "lineread/decoder.hh"

#include <string.h>

namespace lineread {

LineSplitter::LineSplitter(ChunkSource &source, Decoder &decoder, bool strip_cr)
  : source_(source), decoder_(decoder), strip_cr_(strip_cr), position_(0), scanned_(0), bytes_(0), at_end_(false) {}

bool LineSplitter::Next(boost::string_ref &line) {
  while (true) {
    const char *begin = pending_.data() + position_;
    const char *end = pending_.data() + pending_.size();
    const char *newline = static_cast<const char*>(memchr(begin + scanned_, '\n', end - begin - scanned_));
    if (newline) {
      std::size_t length = newline - begin;
      if (strip_cr_ && length && begin[length - 1] == '\r') --length;
      line = boost::string_ref(begin, length);
      position_ = newline + 1 - pending_.data();
      scanned_ = 0;
      return true;
    }
    if (at_end_) {
      if (begin == end) return false;
      // Final line without a terminator.
      line = boost::string_ref(begin, end - begin);
      position_ = pending_.size();
      scanned_ = 0;
      return true;
    }
    scanned_ = end - begin;
    Refill();
  }
}

void LineSplitter::Refill() {
  // Drop what was already returned so the buffer only holds the partial line.
  pending_.erase(0, position_);
  position_ = 0;
  while (source_.Next(chunk_)) {
    if (chunk_.empty()) continue;
    bytes_ += chunk_.size();
    decoder_.Decode(chunk_.data(), chunk_.size(), false, pending_);
    return;
  }
  decoder_.Decode(NULL, 0, true, pending_);
  at_end_ = true;
}

} // namespace lineread
