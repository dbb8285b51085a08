#ifndef LINEREAD_FILE__
#define LINEREAD_FILE__

#include "lineread/exception.hh"

#include <cstddef>
#include <string>

#include <stdint.h>

namespace lineread {

class scoped_fd {
  public:
    scoped_fd() : fd_(-1) {}

    explicit scoped_fd(int fd) : fd_(fd) {}

    ~scoped_fd();

    void reset(int to = -1) {
      scoped_fd other(fd_);
      fd_ = to;
    }

    int get() const { return fd_; }

    int operator*() const { return fd_; }

    int release() {
      int ret = fd_;
      fd_ = -1;
      return ret;
    }

  private:
    int fd_;

    scoped_fd(const scoped_fd &);
    scoped_fd &operator=(const scoped_fd &);
};

/* Thrown for any operation where the fd is known. */
class FDException : public ErrnoException {
  public:
    explicit FDException(int fd) throw();

    virtual ~FDException() throw();

    // This may no longer be valid if the exception was thrown past open.
    int FD() const { return fd_; }

    // Guess from NameFromFD.
    const std::string &NameGuess() const { return name_guess_; }

  private:
    int fd_;

    std::string name_guess_;
};

// Open for read only.
int OpenReadOrThrow(const char *name);

// Return value for SizeFile when it can't size properly.
const uint64_t kBadSize = (uint64_t)-1;
uint64_t SizeFile(int fd);

std::size_t PartialRead(int fd, void *to, std::size_t size);
// Fill to with up to size bytes, stopping early only at end of file.
std::size_t ReadOrEOF(int fd, void *to_void, std::size_t size);

void WriteOrThrow(int fd, const void *data_void, std::size_t size);

/* A descriptor handed to a reader has to be something we can read bytes
 * from: open for reading, not a directory, and not in text mode (Windows).
 * Throws ConfigurationException otherwise.
 */
void CheckReadableOrThrow(int fd, const std::string &name);

/* Attempt get file name from fd.  This won't always work (i.e. on Windows or
 * a pipe).  The file might have been renamed.  It's intended for diagnostics
 * and logging only.
 */
std::string NameFromFD(int fd);

} // namespace lineread

#endif // LINEREAD_FILE__
