#include "lineread/read_compressed.hh"

#include "lineread/file.hh"
#include "lineread/test_util.hh"

#define BOOST_TEST_MODULE ReadCompressedTest
#include <boost/test/unit_test.hpp>

#include <string>

#include <stdint.h>

namespace lineread {
namespace {

void ReadLoop(ReadCompressed &reader, void *to_void, std::size_t amount) {
  uint8_t *to = static_cast<uint8_t*>(to_void);
  while (amount) {
    std::size_t ret = reader.Read(to, amount);
    BOOST_REQUIRE(ret);
    to += ret;
    amount -= ret;
  }
}

std::string RandomishData() {
  const uint32_t kSize4 = 100000 / 4;
  std::string ret;
  for (uint32_t i = 0; i < kSize4; ++i) {
    ret.append(reinterpret_cast<const char*>(&i), sizeof(uint32_t));
  }
  return ret;
}

void TestRandom(Format format) {
  const std::string original(RandomishData());
  test::TempFile file(test::Compress(format, original), test::Suffix(format));

  ReadCompressed reader(OpenReadOrThrow(file.Name().c_str()), format);
  for (uint32_t i = 0; i < original.size() / 4; ++i) {
    uint32_t got;
    ReadLoop(reader, &got, sizeof(uint32_t));
    BOOST_CHECK_EQUAL(i, got);
  }

  char ignored;
  BOOST_CHECK_EQUAL((std::size_t)0, reader.Read(&ignored, 1));
  // Test double EOF call.
  BOOST_CHECK_EQUAL((std::size_t)0, reader.Read(&ignored, 1));
  scoped_fd raw(OpenReadOrThrow(file.Name().c_str()));
  BOOST_CHECK_EQUAL(SizeFile(raw.get()), reader.RawAmount());
}

BOOST_AUTO_TEST_CASE(Uncompressed) {
  TestRandom(kNone);
}

BOOST_AUTO_TEST_CASE(ReadGZ) {
  TestRandom(kGzip);
}

BOOST_AUTO_TEST_CASE(ReadBZ) {
  TestRandom(kBzip2);
}

BOOST_AUTO_TEST_CASE(ReadXZ) {
  TestRandom(kXz);
}

BOOST_AUTO_TEST_CASE(ReadLZMA) {
  TestRandom(kLzma);
}

std::string ReadAll(Format format, const std::string &compressed) {
  test::TempFile file(compressed, test::Suffix(format));
  ReadCompressed reader(OpenReadOrThrow(file.Name().c_str()), format);
  std::string ret;
  char buf[7];
  while (std::size_t got = reader.Read(buf, sizeof(buf))) {
    ret.append(buf, got);
  }
  return ret;
}

// cat a.gz b.gz > both.gz
BOOST_AUTO_TEST_CASE(ConcatenatedGZ) {
  BOOST_CHECK_EQUAL("first\nsecond\n", ReadAll(kGzip, test::Gzip("first\n") + test::Gzip("second\n")));
}

// As pbzip2 writes.
BOOST_AUTO_TEST_CASE(ConcatenatedBZ) {
  BOOST_CHECK_EQUAL("first\nsecond\n", ReadAll(kBzip2, test::Bzip2("first\n") + test::Bzip2("second\n")));
}

BOOST_AUTO_TEST_CASE(ConcatenatedXZ) {
  BOOST_CHECK_EQUAL("first\nsecond\n", ReadAll(kXz, test::Xz("first\n") + test::Xz("second\n")));
}

BOOST_AUTO_TEST_CASE(ConcatenatedLZMA) {
  BOOST_CHECK_EQUAL("first\nsecond\n", ReadAll(kLzma, test::Lzma("first\n") + test::Lzma("second\n")));
}

// Content decides the container, not the suffix.
BOOST_AUTO_TEST_CASE(XZNamedLZMA) {
  BOOST_CHECK_EQUAL("a\nb\n", ReadAll(kLzma, test::Xz("a\nb\n")));
}

BOOST_AUTO_TEST_CASE(LZMANamedXZ) {
  BOOST_CHECK_EQUAL("a\nb\n", ReadAll(kXz, test::Lzma("a\nb\n")));
}

BOOST_AUTO_TEST_CASE(MixedXZAndLZMA) {
  BOOST_CHECK_EQUAL("first\nsecond\n", ReadAll(kXz, test::Xz("first\n") + test::Lzma("second\n")));
}

BOOST_AUTO_TEST_CASE(PaddedGZ) {
  const std::string padding(16, '\0');
  BOOST_CHECK_EQUAL("x\ny\n", ReadAll(kGzip, test::Gzip("x\ny\n") + padding));
  BOOST_CHECK_EQUAL("x\ny\n", ReadAll(kGzip, test::Gzip("x\n") + padding + test::Gzip("y\n") + padding));
  // Longer than one input buffer.
  BOOST_CHECK_EQUAL("x\n", ReadAll(kGzip, test::Gzip("x\n") + std::string(40000, '\0')));
}

BOOST_AUTO_TEST_CASE(PaddedXZ) {
  const std::string padding(8, '\0');
  BOOST_CHECK_EQUAL("x\ny\n", ReadAll(kXz, test::Xz("x\n") + padding + test::Xz("y\n") + padding));
  BOOST_CHECK_EQUAL("x\n", ReadAll(kLzma, test::Lzma("x\n") + padding));
}

BOOST_AUTO_TEST_CASE(TrailingGarbage) {
  BOOST_CHECK_THROW(ReadAll(kGzip, test::Gzip("x\n") + "garbage"), GZException);
  BOOST_CHECK_THROW(ReadAll(kXz, test::Xz("x\n") + "garbage"), XZException);
  BOOST_CHECK_THROW(ReadAll(kLzma, test::Lzma("x\n") + "garbage"), XZException);
}

BOOST_AUTO_TEST_CASE(ZeroBytes) {
  BOOST_CHECK_EQUAL("", ReadAll(kGzip, ""));
  BOOST_CHECK_EQUAL("", ReadAll(kBzip2, ""));
  BOOST_CHECK_EQUAL("", ReadAll(kXz, ""));
  BOOST_CHECK_EQUAL("", ReadAll(kLzma, ""));
}

BOOST_AUTO_TEST_CASE(TruncatedGZ) {
  std::string compressed(test::Gzip(RandomishData()));
  compressed.resize(compressed.size() / 2);
  BOOST_CHECK_THROW(ReadAll(kGzip, compressed), GZException);
}

BOOST_AUTO_TEST_CASE(TruncatedBZ) {
  std::string compressed(test::Bzip2(RandomishData()));
  compressed.resize(compressed.size() / 2);
  BOOST_CHECK_THROW(ReadAll(kBzip2, compressed), BZException);
}

BOOST_AUTO_TEST_CASE(TruncatedXZ) {
  std::string compressed(test::Xz(RandomishData()));
  compressed.resize(compressed.size() / 2);
  BOOST_CHECK_THROW(ReadAll(kXz, compressed), XZException);
}

BOOST_AUTO_TEST_CASE(NotCompressed) {
  BOOST_CHECK_THROW(ReadAll(kGzip, "this is plain text, not gzip\n"), CompressedException);
  BOOST_CHECK_THROW(ReadAll(kBzip2, "this is plain text, not bzip2\n"), CompressedException);
  BOOST_CHECK_THROW(ReadAll(kXz, "this is plain text, not xz\n"), CompressedException);
}

} // namespace
} // namespace lineread
