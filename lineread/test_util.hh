#ifndef LINEREAD_TEST_UTIL__
#define LINEREAD_TEST_UTIL__

#include "lineread/format.hh"

#include <string>

// Fixtures shared by the tests.  Compression happens in process so the tests
// don't depend on gzip, bzip2, or xz programs being installed.
namespace lineread {
namespace test {

std::string Gzip(const std::string &data);
std::string Bzip2(const std::string &data);
std::string Xz(const std::string &data);
// Legacy LZMA_Alone container.
std::string Lzma(const std::string &data);

// Dispatch on format.  kNone returns data as is.
std::string Compress(Format format, const std::string &data);

// The usual file suffix for format, including the dot.  Empty for kNone.
const char *Suffix(Format format);

// A file in /tmp holding contents, deleted by the destructor.
class TempFile {
  public:
    TempFile(const std::string &contents, const std::string &suffix = "");

    ~TempFile();

    const std::string &Name() const { return name_; }

  private:
    std::string name_;

    TempFile(const TempFile &);
    TempFile &operator=(const TempFile &);
};

} // namespace test
} // namespace lineread

#endif // LINEREAD_TEST_UTIL__
