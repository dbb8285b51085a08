#ifndef LINEREAD_READ_COMPRESSED__
#define LINEREAD_READ_COMPRESSED__

#include "lineread/exception.hh"
#include "lineread/format.hh"

#include <cstddef>
#include <memory>

#include <stdint.h>

namespace lineread {

// Corrupt or truncated compressed input.
class CompressedException : public Exception {
  public:
    CompressedException() throw();
    virtual ~CompressedException() throw();
};

class GZException : public CompressedException {
  public:
    GZException() throw();
    ~GZException() throw();
};

class BZException : public CompressedException {
  public:
    BZException() throw();
    ~BZException() throw();
};

class XZException : public CompressedException {
  public:
    XZException() throw();
    ~XZException() throw();
};

class ReadBase;

/* Decompress a file descriptor with the engine named by format.  The engines
 * are zlib (gzip, including concatenated members), libbz2 (including
 * concatenated streams as written by pbzip2) and liblzma (.xz streams and
 * legacy .lzma files, told apart by content for either suffix).  NUL padding
 * after gzip members and xz streams is skipped.  kNone passes bytes through.
 */
class ReadCompressed {
  public:
    // Takes ownership of fd.
    ReadCompressed(int fd, Format format);

    ~ReadCompressed();

    // Returns at least one byte unless the stream has ended, then 0 forever.
    std::size_t Read(void *to, std::size_t amount);

    // Bytes taken from the underlying file so far.
    uint64_t RawAmount() const { return raw_amount_; }

  private:
    friend class ReadBase;

    std::unique_ptr<ReadBase> internal_;

    uint64_t raw_amount_;

    // No copying.
    ReadCompressed(const ReadCompressed &);
    void operator=(const ReadCompressed &);
};

} // namespace lineread

#endif // LINEREAD_READ_COMPRESSED__
