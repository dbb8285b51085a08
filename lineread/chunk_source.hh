#ifndef LINEREAD_CHUNK_SOURCE__
#define LINEREAD_CHUNK_SOURCE__

#include "lineread/format.hh"
#include "lineread/read_compressed.hh"

#include <boost/thread/thread.hpp>

#include <cstddef>
#include <exception>
#include <memory>
#include <string>

#include <stdint.h>

namespace lineread {

// Raw bytes of a file, in file order, one chunk at a time.
class ChunkSource {
  public:
    virtual ~ChunkSource() {}

    // Replace chunk with the next non-empty chunk.  False at end of stream.
    virtual bool Next(std::string &chunk) = 0;

    // Name of the strategy for statistics: "compressed" or "buffered".
    virtual const char *Strategy() const = 0;

    // Bytes taken from the file itself, before any decompression.
    virtual uint64_t RawAmount() const = 0;
};

/* Decompresses on the caller's thread.  The engines already interleave
 * their CPU work with the caller's consumption, so there's no thread here.
 */
class CompressedChunkSource : public ChunkSource {
  public:
    // Opens path immediately.  Throws ConfigurationException for an empty
    // path or kNone.
    CompressedChunkSource(const std::string &path, Format format, std::size_t chunk_size);

    ~CompressedChunkSource();

    bool Next(std::string &chunk);

    const char *Strategy() const { return "compressed"; }

    uint64_t RawAmount() const { return raw_amount_; }

  private:
    // Reset once the stream is exhausted, which closes the file.
    std::unique_ptr<ReadCompressed> reader_;

    const std::size_t chunk_size_;

    uint64_t raw_amount_;
};

// What the reading thread hands to the consumer.
struct ChunkMessage {
  enum Kind { kData, kEnd, kError };

  ChunkMessage() : kind(kData) {}

  Kind kind;
  std::string data;
  std::exception_ptr error;
};

/* Reads a plain descriptor on a background thread so that read() latency
 * overlaps decoding.  Chunks travel through a BoundedQueue; the thread blocks
 * once queue_size chunks are waiting, which bounds memory to
 * queue_size * chunk_size.  A read error is captured by the thread and
 * rethrown from Next at the position of the chunk that failed.
 */
class ThreadedChunkSource : public ChunkSource {
  public:
    static const std::size_t kQueueSize = 8;

    // Takes ownership of fd.
    ThreadedChunkSource(int fd, std::size_t chunk_size, std::size_t queue_size = kQueueSize);

    // Does not wait for the file to be drained.  A thread still stuck in
    // read() after a short wait is detached and closes the file on its own.
    ~ThreadedChunkSource();

    bool Next(std::string &chunk);

    const char *Strategy() const { return "buffered"; }

    uint64_t RawAmount() const { return raw_amount_; }

  private:
    struct Shared;

    static void Produce(std::shared_ptr<Shared> shared);

    void Finish();

    void Abandon();

    // Also referenced by the thread, so a detached thread never outlives it.
    std::shared_ptr<Shared> shared_;

    boost::thread thread_;

    bool finished_;

    uint64_t raw_amount_;

    ChunkMessage message_;

    ThreadedChunkSource(const ThreadedChunkSource &);
    ThreadedChunkSource &operator=(const ThreadedChunkSource &);
};

} // namespace lineread

#endif // LINEREAD_CHUNK_SOURCE__
