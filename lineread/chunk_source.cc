#include "lineread/chunk_source.hh"

#include "lineread/bounded_queue.hh"
#include "lineread/exception.hh"
#include "lineread/file.hh"

#include <boost/chrono.hpp>

#include <atomic>
#include <iostream>

namespace lineread {

CompressedChunkSource::CompressedChunkSource(const std::string &path, Format format, std::size_t chunk_size)
  : chunk_size_(chunk_size), raw_amount_(0) {
  LINEREAD_THROW_IF(path.empty(), ConfigurationException, "Compressed reading requires a path to open, not a stream.");
  LINEREAD_THROW_IF(format == kNone, ConfigurationException, "Not a compressed format: " << path);
  LINEREAD_THROW_IF(!chunk_size_, ConfigurationException, "Chunk size must be positive.");
  reader_.reset(new ReadCompressed(OpenReadOrThrow(path.c_str()), format));
}

CompressedChunkSource::~CompressedChunkSource() {}

bool CompressedChunkSource::Next(std::string &chunk) {
  if (!reader_.get()) return false;
  chunk.resize(chunk_size_);
  std::size_t filled = 0;
  while (filled < chunk_size_) {
    std::size_t got = reader_->Read(&chunk[filled], chunk_size_ - filled);
    if (!got) break;
    filled += got;
  }
  raw_amount_ = reader_->RawAmount();
  chunk.resize(filled);
  if (!filled) {
    reader_.reset();
    return false;
  }
  return true;
}

const std::size_t ThreadedChunkSource::kQueueSize;

namespace {
// How long teardown waits for the reading thread before detaching it.
const unsigned int kJoinWaitMilliseconds = 10;
} // namespace

struct ThreadedChunkSource::Shared {
  Shared(int fd, std::size_t in_chunk_size, std::size_t queue_size)
    : file(fd), chunk_size(in_chunk_size), queue(queue_size), stop(false) {}

  scoped_fd file;

  const std::size_t chunk_size;

  BoundedQueue<ChunkMessage> queue;

  // Set when the consumer goes away early.
  std::atomic<bool> stop;
};

ThreadedChunkSource::ThreadedChunkSource(int fd, std::size_t chunk_size, std::size_t queue_size)
  : shared_(new Shared(fd, chunk_size, queue_size)), finished_(false), raw_amount_(0) {
  LINEREAD_THROW_IF(!chunk_size, ConfigurationException, "Chunk size must be positive.");
  LINEREAD_THROW_IF(!queue_size, ConfigurationException, "Queue size must be positive.");
  thread_ = boost::thread(&ThreadedChunkSource::Produce, shared_);
}

ThreadedChunkSource::~ThreadedChunkSource() {
  if (finished_) return;
  try {
    Abandon();
  } catch (const std::exception &e) {
    std::cerr << "Failed to stop the reading thread: " << e.what() << std::endl;
  }
}

void ThreadedChunkSource::Produce(std::shared_ptr<Shared> shared) {
  ChunkMessage message;
  std::exception_ptr failure;
  try {
    while (!shared->stop.load()) {
      message.data.resize(shared->chunk_size);
      std::size_t got = ReadOrEOF(shared->file.get(), &message.data[0], shared->chunk_size);
      if (shared->stop.load()) return;
      message.data.resize(got);
      message.kind = got ? ChunkMessage::kData : ChunkMessage::kEnd;
      shared->queue.ProduceSwap(message);
      if (!got) return;
    }
    return;
  } catch (...) {
    failure = std::current_exception();
  }
  // Nobody is left to report to once stop is set.
  if (shared->stop.load()) return;
  message.kind = ChunkMessage::kError;
  message.data.clear();
  message.error = failure;
  shared->queue.ProduceSwap(message);
}

bool ThreadedChunkSource::Next(std::string &chunk) {
  if (finished_) return false;
  shared_->queue.ConsumeSwap(message_);
  switch (message_.kind) {
    case ChunkMessage::kData:
      raw_amount_ += message_.data.size();
      // The old contents of chunk go back to the thread as a spare buffer.
      chunk.swap(message_.data);
      return true;
    case ChunkMessage::kEnd:
      Finish();
      return false;
    case ChunkMessage::kError:
      Finish();
      std::rethrow_exception(message_.error);
  }
  return false;
}

void ThreadedChunkSource::Finish() {
  finished_ = true;
  // The thread returns right after sending kEnd or kError.
  thread_.join();
  // Closes the file.
  shared_.reset();
}

void ThreadedChunkSource::Abandon() {
  finished_ = true;
  shared_->stop.store(true);
  // Free every slot so a thread blocked on a full queue wakes up and sees stop.
  ChunkMessage discard;
  while (shared_->queue.TryConsumeSwap(discard)) {}
  if (!thread_.try_join_for(boost::chrono::milliseconds(kJoinWaitMilliseconds))) {
    // Still inside read().  It holds its own reference to shared state.
    thread_.detach();
  }
  shared_.reset();
}

} // namespace lineread
