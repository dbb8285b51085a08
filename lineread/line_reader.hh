#ifndef LINEREAD_LINE_READER__
#define LINEREAD_LINE_READER__

#include "lineread/config.hh"
#include "lineread/file.hh"
#include "lineread/format.hh"
#include "lineread/stats.hh"

#include <boost/iterator/iterator_facade.hpp>
#include <boost/timer/timer.hpp>
#include <boost/utility/string_ref.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace lineread {

class ChunkSource;
class Decoder;
class ErsatzProgress;
class LineReader;
class LineSplitter;

// Input iterator over the lines of a LineReader.  Default constructed is end.
class LineIterator : public boost::iterator_facade<LineIterator, const boost::string_ref, boost::single_pass_traversal_tag> {
  public:
    LineIterator() : reader_(NULL) {}

    explicit LineIterator(LineReader &reader) : reader_(&reader) {
      increment();
    }

  private:
    friend class boost::iterator_core_access;

    void increment();

    bool equal(const LineIterator &other) const {
      return reader_ == other.reader_;
    }

    const boost::string_ref &dereference() const { return line_; }

    LineReader *reader_;

    boost::string_ref line_;
};

/* Reads a text file line by line, decoded to UTF-8 with terminators removed.
 *
 * Files ending in .gz, .bz2, .xz, or .lzma are decompressed on the caller's
 * thread.  Anything else is read by a background thread into a bounded
 * queue of chunks.  Nothing is opened until the first line is requested.
 *
 * One reader makes one pass.  Once the end is reached, an error is thrown,
 * or Close is called, the file is closed, the background thread is gone,
 * and ReadLine returns false from then on.  GetStats stays valid throughout.
 *
 * Not thread safe: use one reader from one thread.
 */
class LineReader {
  public:
    // Configuration errors, like an unknown encoding, throw here.  Failure
    // to open the file is reported by the first ReadLine.
    explicit LineReader(const std::string &path, const Config &config = Config());

    /* Read an already open descriptor, always as plain bytes.  Takes
     * ownership of fd.  name is used for messages and statistics; NULL asks
     * the system for one.  Throws ConfigurationException if fd isn't open for
     * reading or is a directory.
     */
    explicit LineReader(int fd, const char *name = NULL, const Config &config = Config());

    // Closes without waiting for the rest of the file.
    ~LineReader();

    /* The next line without its terminator.  Memory backing line is valid
     * until the next call.  Returns false at the end and after Close.
     * Exceptions from opening, reading, decompressing, or decoding propagate
     * and leave the reader closed.
     */
    bool ReadLine(boost::string_ref &line);

    // Copying version.
    bool ReadLine(std::string &line);

    // Idempotent.
    void Close();

    bool Closed() const { return state_ == kClosed; }

    Stats GetStats() const;

    Format GetFormat() const { return format_; }

    const std::string &FileName() const { return file_name_; }

    LineIterator begin() { return LineIterator(*this); }

    LineIterator end() { return LineIterator(); }

  private:
    void Start();

    // Release everything and stop the clock.  completed is true at the end of
    // the stream.
    void Finish(bool completed);

    enum State { kUnopened, kStreaming, kClosed };

    State state_;

    // Empty when reading a descriptor.
    const std::string path_;

    std::string file_name_;

    // Descriptor passed to the constructor until Start hands it on.
    scoped_fd fd_;

    const Config config_;

    const Format format_;

    std::unique_ptr<Decoder> decoder_;

    std::unique_ptr<ChunkSource> source_;

    std::unique_ptr<LineSplitter> splitter_;

    std::unique_ptr<ErsatzProgress> progress_;

    // Runs from Start to Finish.
    boost::timer::cpu_timer timer_;
    bool timed_;

    Stats stats_;

    LineReader(const LineReader &);
    LineReader &operator=(const LineReader &);
};

} // namespace lineread

#endif // LINEREAD_LINE_READER__
