#include "lineread/chunk_source.hh"

#include "lineread/exception.hh"
#include "lineread/file.hh"
#include "lineread/test_util.hh"

#define BOOST_TEST_MODULE ChunkSourceTest
#include <boost/test/unit_test.hpp>

#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace lineread {
namespace {

std::string Numbers(unsigned int count) {
  std::string ret;
  for (unsigned int i = 0; i < count; ++i) {
    ret += std::to_string(i);
    ret += '\n';
  }
  return ret;
}

// Concatenate everything and check that only the last chunk is short.
std::string Drain(ChunkSource &source, std::size_t chunk_size) {
  std::string all, chunk;
  bool short_seen = false;
  while (source.Next(chunk)) {
    BOOST_CHECK(!chunk.empty());
    BOOST_CHECK(chunk.size() <= chunk_size);
    BOOST_CHECK(!short_seen);
    if (chunk.size() < chunk_size) short_seen = true;
    all += chunk;
  }
  // Still over.
  BOOST_CHECK(!source.Next(chunk));
  return all;
}

BOOST_AUTO_TEST_CASE(ThreadedInOrder) {
  const std::string contents(Numbers(10000));
  test::TempFile file(contents);
  ThreadedChunkSource source(OpenReadOrThrow(file.Name().c_str()), 7);
  BOOST_CHECK_EQUAL("buffered", std::string(source.Strategy()));
  BOOST_CHECK(contents == Drain(source, 7));
  BOOST_CHECK_EQUAL(contents.size(), source.RawAmount());
}

BOOST_AUTO_TEST_CASE(ThreadedEmpty) {
  test::TempFile file("");
  ThreadedChunkSource source(OpenReadOrThrow(file.Name().c_str()), 16);
  std::string chunk;
  BOOST_CHECK(!source.Next(chunk));
  BOOST_CHECK_EQUAL(0U, source.RawAmount());
}

BOOST_AUTO_TEST_CASE(ThreadedQueueSizeOne) {
  const std::string contents(Numbers(1000));
  test::TempFile file(contents);
  ThreadedChunkSource source(OpenReadOrThrow(file.Name().c_str()), 1, 1);
  BOOST_CHECK(contents == Drain(source, 1));
}

// The thread is blocked on a full queue when the consumer leaves.
BOOST_AUTO_TEST_CASE(ThreadedAbandonFullQueue) {
  test::TempFile file(Numbers(100000));
  ThreadedChunkSource source(OpenReadOrThrow(file.Name().c_str()), 1, 2);
  std::string chunk;
  BOOST_REQUIRE(source.Next(chunk));
  BOOST_CHECK_EQUAL("0", chunk);
}

// The thread is stuck in read() on a pipe nobody writes to.
BOOST_AUTO_TEST_CASE(ThreadedAbandonBlockedRead) {
  int fds[2];
  BOOST_REQUIRE_EQUAL(0, pipe(fds));
  scoped_fd writing(fds[1]);
  {
    ThreadedChunkSource source(fds[0], 64);
  }
  // Lets the detached thread see end of file and exit.
  writing.reset();
}

BOOST_AUTO_TEST_CASE(ThreadedPipe) {
  int fds[2];
  BOOST_REQUIRE_EQUAL(0, pipe(fds));
  const std::string contents("not seekable\nat all\n");
  {
    scoped_fd writing(fds[1]);
    WriteOrThrow(writing.get(), contents.data(), contents.size());
  }
  ThreadedChunkSource source(fds[0], 5);
  BOOST_CHECK_EQUAL(contents, Drain(source, 5));
}

BOOST_AUTO_TEST_CASE(ThreadedReadErrorRethrown) {
  int fd = open("/tmp", O_RDONLY);
  BOOST_REQUIRE(fd != -1);
  ThreadedChunkSource source(fd, 16);
  std::string chunk;
  BOOST_CHECK_THROW(source.Next(chunk), FDException);
  // The error ends the stream.
  BOOST_CHECK(!source.Next(chunk));
}

BOOST_AUTO_TEST_CASE(ThreadedBadSizes) {
  test::TempFile file("a\n");
  BOOST_CHECK_THROW(ThreadedChunkSource(OpenReadOrThrow(file.Name().c_str()), 0), ConfigurationException);
}

BOOST_AUTO_TEST_CASE(CompressedInOrder) {
  const std::string contents(Numbers(10000));
  const Format formats[] = {kGzip, kBzip2, kXz, kLzma};
  for (const Format *i = formats; i != formats + sizeof(formats) / sizeof(Format); ++i) {
    test::TempFile file(test::Compress(*i, contents), test::Suffix(*i));
    CompressedChunkSource source(file.Name(), *i, 4096);
    BOOST_CHECK_EQUAL("compressed", std::string(source.Strategy()));
    BOOST_CHECK(contents == Drain(source, 4096));
    BOOST_CHECK(source.RawAmount() > 0);
  }
}

BOOST_AUTO_TEST_CASE(CompressedNeedsPath) {
  BOOST_CHECK_THROW(CompressedChunkSource("", kGzip, 4096), ConfigurationException);
  test::TempFile file("plain\n");
  BOOST_CHECK_THROW(CompressedChunkSource(file.Name(), kNone, 4096), ConfigurationException);
  BOOST_CHECK_THROW(CompressedChunkSource("/tmp/lineread_does_not_exist.gz", kGzip, 4096), ErrnoException);
}

} // namespace
} // namespace lineread
