#ifndef LINEREAD_ERSATZ_PROGRESS__
#define LINEREAD_ERSATZ_PROGRESS__

#include <iosfwd>
#include <string>

#include <stdint.h>

namespace lineread {

// A bar of 100 stars drawn as progress is made toward complete.
class ErsatzProgress {
  public:
    // Null means no output.
    ErsatzProgress(uint64_t complete, std::ostream *to, const std::string &message);

    ~ErsatzProgress();

    void Set(uint64_t to) {
      if ((current_ = to) >= next_) Milestone();
    }

    void Finished() {
      Set(complete_);
    }

    // Stop drawing without completing the bar.
    void Abandon();

  private:
    void Milestone();

    uint64_t current_, next_, complete_;
    unsigned char stones_written_;
    std::ostream *out_;

    // noncopyable
    ErsatzProgress(const ErsatzProgress &other);
    ErsatzProgress &operator=(const ErsatzProgress &other);
};

} // namespace lineread

#endif // LINEREAD_ERSATZ_PROGRESS__
