#include "lineread/ersatz_progress.hh"

#include <algorithm>
#include <limits>
#include <ostream>

namespace lineread {

namespace { const unsigned char kWidth = 100; }

ErsatzProgress::~ErsatzProgress() {
  if (!out_) return;
  Finished();
}

ErsatzProgress::ErsatzProgress(uint64_t complete, std::ostream *to, const std::string &message)
  : current_(0), next_(complete / kWidth), complete_(complete), stones_written_(0), out_(to) {
  if (!out_ || !complete_) {
    out_ = NULL;
    next_ = std::numeric_limits<uint64_t>::max();
    return;
  }
  *out_ << message << "\n----5---10---15---20---25---30---35---40---45---50---55---60---65---70---75---80---85---90---95--100\n";
}

void ErsatzProgress::Abandon() {
  if (out_) *out_ << std::endl;
  out_ = NULL;
  next_ = std::numeric_limits<uint64_t>::max();
}

void ErsatzProgress::Milestone() {
  if (!out_) return;
  unsigned char stone = static_cast<unsigned char>(std::min<uint64_t>(kWidth, (current_ * kWidth) / complete_));

  for (; stones_written_ < stone; ++stones_written_) {
    (*out_) << '*';
  }
  if (stone == kWidth) {
    (*out_) << std::endl;
    next_ = std::numeric_limits<uint64_t>::max();
    out_ = NULL;
  } else {
    next_ = std::max(next_, ((stone + 1) * complete_) / kWidth);
  }
}

} // namespace lineread
