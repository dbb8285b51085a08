#include "lineread/line_splitter.hh"

#include "lineread/chunk_source.hh"
#include "lineread/decoder.hh"
#include "lineread/exception.hh"

#define BOOST_TEST_MODULE LineSplitterTest
#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

namespace lineread {
namespace {

// Hands out fixed chunks, including empty ones, to exercise the splitter.
class VectorSource : public ChunkSource {
  public:
    explicit VectorSource(const std::vector<std::string> &chunks) : chunks_(chunks), next_(0), raw_(0) {}

    bool Next(std::string &chunk) {
      if (next_ == chunks_.size()) return false;
      chunk = chunks_[next_++];
      raw_ += chunk.size();
      return true;
    }

    const char *Strategy() const { return "vector"; }

    uint64_t RawAmount() const { return raw_; }

  private:
    std::vector<std::string> chunks_;
    std::size_t next_;
    uint64_t raw_;
};

std::vector<std::string> Cut(const std::string &text, std::size_t size) {
  std::vector<std::string> ret;
  for (std::size_t i = 0; i < text.size(); i += size) {
    ret.push_back(text.substr(i, size));
  }
  return ret;
}

std::vector<std::string> Split(const std::vector<std::string> &chunks, bool strip_cr = false, DecodeErrorPolicy policy = kStrict) {
  VectorSource source(chunks);
  Decoder decoder("UTF-8", policy);
  LineSplitter splitter(source, decoder, strip_cr);
  std::vector<std::string> ret;
  boost::string_ref line;
  while (splitter.Next(line)) {
    ret.push_back(std::string(line.data(), line.size()));
  }
  // Stays at the end.
  BOOST_CHECK(!splitter.Next(line));
  return ret;
}

std::vector<std::string> Lines(const char *a, const char *b = NULL, const char *c = NULL) {
  std::vector<std::string> ret;
  ret.push_back(a);
  if (b) ret.push_back(b);
  if (c) ret.push_back(c);
  return ret;
}

BOOST_AUTO_TEST_CASE(ThreeLinesChunkFour) {
  std::vector<std::string> got(Split(Cut("line1\nline2\nline3", 4)));
  std::vector<std::string> expected(Lines("line1", "line2", "line3"));
  BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(), got.begin(), got.end());
}

BOOST_AUTO_TEST_CASE(EmptyLinesKept) {
  std::vector<std::string> expected(Lines("a", "", " b"));
  for (std::size_t size = 1; size <= 6; ++size) {
    std::vector<std::string> got(Split(Cut("a\n\n b", size)));
    BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(), got.begin(), got.end());
  }
}

BOOST_AUTO_TEST_CASE(NoTrailingEmptyLine) {
  std::vector<std::string> got(Split(Cut("x\ny\n", 3)));
  std::vector<std::string> expected(Lines("x", "y"));
  BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(), got.begin(), got.end());
}

BOOST_AUTO_TEST_CASE(NoTerminator) {
  std::vector<std::string> got(Split(Cut("just one line", 5)));
  BOOST_REQUIRE_EQUAL(1U, got.size());
  BOOST_CHECK_EQUAL("just one line", got[0]);
}

BOOST_AUTO_TEST_CASE(Nothing) {
  BOOST_CHECK(Split(std::vector<std::string>()).empty());
  BOOST_CHECK(Split(std::vector<std::string>(3)).empty());
}

BOOST_AUTO_TEST_CASE(OnlyNewline) {
  std::vector<std::string> got(Split(Cut("\n", 1)));
  BOOST_REQUIRE_EQUAL(1U, got.size());
  BOOST_CHECK_EQUAL("", got[0]);
}

BOOST_AUTO_TEST_CASE(EmptyChunksNotCounted) {
  std::vector<std::string> chunks;
  chunks.push_back("");
  chunks.push_back("ab\n");
  chunks.push_back("");
  chunks.push_back("");
  chunks.push_back("c");
  VectorSource source(chunks);
  Decoder decoder("UTF-8", kStrict);
  LineSplitter splitter(source, decoder);
  boost::string_ref line;
  BOOST_REQUIRE(splitter.Next(line));
  BOOST_CHECK_EQUAL("ab", line);
  BOOST_CHECK_EQUAL(3U, splitter.BytesConsumed());
  BOOST_REQUIRE(splitter.Next(line));
  BOOST_CHECK_EQUAL("c", line);
  BOOST_CHECK_EQUAL(4U, splitter.BytesConsumed());
  BOOST_CHECK(!splitter.Next(line));
  BOOST_CHECK_EQUAL(0U, splitter.Pending());
}

BOOST_AUTO_TEST_CASE(CarriageReturns) {
  std::vector<std::string> expected(Lines("a", "b\rc", "d\r"));
  std::vector<std::string> got(Split(Cut("a\r\nb\rc\r\nd\r", 1), true));
  BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(), got.begin(), got.end());
  // Left alone by default.
  std::vector<std::string> kept(Split(Cut("a\r\n", 1)));
  BOOST_REQUIRE_EQUAL(1U, kept.size());
  BOOST_CHECK_EQUAL("a\r", kept[0]);
}

// Chunk size 1 splits every multi-byte character.
BOOST_AUTO_TEST_CASE(MultiByteAcrossChunks) {
  std::vector<std::string> expected(Lines("caf\xC3\xA9", "\xE2\x82\xAC\xF0\x9F\x98\x80"));
  for (std::size_t size = 1; size <= 5; ++size) {
    std::vector<std::string> got(Split(Cut("caf\xC3\xA9\n\xE2\x82\xAC\xF0\x9F\x98\x80\n", size)));
    BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(), got.begin(), got.end());
  }
}

BOOST_AUTO_TEST_CASE(StrictStopsAtBadLine) {
  VectorSource source(Cut("good\n\xFF\n", 1));
  Decoder decoder("UTF-8", kStrict);
  LineSplitter splitter(source, decoder);
  boost::string_ref line;
  BOOST_REQUIRE(splitter.Next(line));
  BOOST_CHECK_EQUAL("good", line);
  BOOST_CHECK_THROW(splitter.Next(line), DecodeException);
}

BOOST_AUTO_TEST_CASE(ReplaceKeepsGoing) {
  std::vector<std::string> expected(Lines("good", "\xEF\xBF\xBD", "after"));
  std::vector<std::string> got(Split(Cut("good\n\xFF\nafter\n", 2), false, kReplace));
  BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(), got.begin(), got.end());
}

} // namespace
} // namespace lineread
