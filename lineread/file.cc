#define _LARGEFILE64_SOURCE
#define _FILE_OFFSET_BITS 64

#include "lineread/file.hh"

#include "lineread/exception.hh"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <sys/stat.h>
#include <sys/types.h>

#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace lineread {

scoped_fd::~scoped_fd() {
  if (fd_ != -1 && close(fd_)) {
    std::cerr << "Could not close file " << fd_ << std::endl;
  }
}

// Note that ErrnoException records errno before NameFromFD is called.
FDException::FDException(int fd) throw() : fd_(fd), name_guess_(NameFromFD(fd)) {
  *this << "in " << name_guess_ << ' ';
}

FDException::~FDException() throw() {}

int OpenReadOrThrow(const char *name) {
  int ret;
#if defined(_WIN32) || defined(_WIN64)
  LINEREAD_THROW_IF(-1 == (ret = _open(name, _O_BINARY | _O_RDONLY)), ErrnoException, "while opening " << name);
#else
  LINEREAD_THROW_IF(-1 == (ret = open(name, O_RDONLY)), ErrnoException, "while opening " << name);
#endif
  return ret;
}

uint64_t SizeFile(int fd) {
#if defined(_WIN32) || defined(_WIN64)
  __int64 ret = _filelengthi64(fd);
  return (ret == -1) ? kBadSize : ret;
#else
  struct stat sb;
  int ret = fstat(fd, &sb);
  if (ret == -1 || !S_ISREG(sb.st_mode)) return kBadSize;
  return sb.st_size;
#endif
}

namespace {
std::size_t GuardLarge(std::size_t size) {
  // These have read() that only supports up to 2^31.
#if defined(_WIN32) || defined(_WIN64) || defined(__APPLE__)
  return std::min(static_cast<std::size_t>(static_cast<unsigned>(-1) >> 1), size);
#else
  return size;
#endif
}
} // namespace

std::size_t PartialRead(int fd, void *to, std::size_t amount) {
#if defined(_WIN32) || defined(_WIN64)
  int ret = _read(fd, to, GuardLarge(amount));
#else
  errno = 0;
  ssize_t ret;
  do {
    ret = read(fd, to, GuardLarge(amount));
  } while (ret == -1 && errno == EINTR);
#endif
  LINEREAD_THROW_IF_ARG(ret < 0, FDException, (fd), "while reading " << amount << " bytes");
  return static_cast<std::size_t>(ret);
}

std::size_t ReadOrEOF(int fd, void *to_void, std::size_t amount) {
  uint8_t *to = static_cast<uint8_t*>(to_void);
  std::size_t remaining = amount;
  while (remaining) {
    std::size_t ret = PartialRead(fd, to, remaining);
    if (!ret) return amount - remaining;
    remaining -= ret;
    to += ret;
  }
  return amount;
}

void WriteOrThrow(int fd, const void *data_void, std::size_t size) {
  const uint8_t *data = static_cast<const uint8_t*>(data_void);
  while (size) {
#if defined(_WIN32) || defined(_WIN64)
    int ret = _write(fd, data, GuardLarge(size));
#else
    ssize_t ret;
    errno = 0;
    do {
      ret = write(fd, data, GuardLarge(size));
    } while (ret == -1 && errno == EINTR);
#endif
    LINEREAD_THROW_IF_ARG(ret < 1, FDException, (fd), "while writing " << size << " bytes");
    data += ret;
    size -= ret;
  }
}

void CheckReadableOrThrow(int fd, const std::string &name) {
  LINEREAD_THROW_IF(fd < 0, ConfigurationException, "No open descriptor for " << name);
#if defined(_WIN32) || defined(_WIN64)
  // _setmode returns the previous mode; leave it as we found it.
  int previous = _setmode(fd, _O_BINARY);
  LINEREAD_THROW_IF(previous == -1, ConfigurationException, "Descriptor " << fd << " for " << name << " is not open");
  if (previous != _O_BINARY) {
    _setmode(fd, previous);
    LINEREAD_THROW(ConfigurationException, name << " must be opened in binary mode");
  }
#else
  int flags = fcntl(fd, F_GETFL);
  LINEREAD_THROW_IF(flags == -1, ConfigurationException, "Descriptor " << fd << " for " << name << " is not open");
  LINEREAD_THROW_IF((flags & O_ACCMODE) == O_WRONLY, ConfigurationException, name << " must be opened for reading");
  struct stat sb;
  LINEREAD_THROW_IF(-1 == fstat(fd, &sb), ConfigurationException, "Could not stat " << name);
  LINEREAD_THROW_IF(S_ISDIR(sb.st_mode), ConfigurationException, name << " is a directory");
#endif
}

namespace {
// Try to name things but be willing to fail too.
bool TryName(int fd, std::string &out) {
#if defined(_WIN32) || defined(_WIN64)
  return false;
#else
  std::ostringstream name;
  name << "/proc/self/fd/" << fd;
  char buf[4096];
  ssize_t ret = readlink(name.str().c_str(), buf, sizeof(buf));
  if (ret <= 0 || ret == static_cast<ssize_t>(sizeof(buf)))
    return false;
  // Don't use the non-file names like pipe:[1234].
  if (buf[0] != '/')
    return false;
  out.assign(buf, ret);
  return true;
#endif
}
} // namespace

std::string NameFromFD(int fd) {
  std::string ret;
  if (TryName(fd, ret)) return ret;
  switch (fd) {
    case 0: return "stdin";
    case 1: return "stdout";
    case 2: return "stderr";
  }
  std::ostringstream convert;
  convert << "fd " << fd;
  return convert.str();
}

} // namespace lineread
