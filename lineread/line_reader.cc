#include "lineread/line_reader.hh"

#include "lineread/chunk_source.hh"
#include "lineread/decoder.hh"
#include "lineread/ersatz_progress.hh"
#include "lineread/exception.hh"
#include "lineread/line_splitter.hh"

#include <ostream>

namespace lineread {

namespace {
std::string BaseName(const std::string &name) {
  std::string::size_type slash = name.find_last_of("/\\");
  return slash == std::string::npos ? name : name.substr(slash + 1);
}
} // namespace

void LineIterator::increment() {
  if (!reader_->ReadLine(line_)) reader_ = NULL;
}

LineReader::LineReader(const std::string &path, const Config &config)
  : state_(kUnopened),
    path_(path),
    file_name_(path),
    config_(config),
    format_(DetectFormat(path)),
    decoder_(new Decoder(config.encoding, config.errors)),
    timed_(false) {
  LINEREAD_THROW_IF(path.empty(), ConfigurationException, "Empty file name.");
  stats_.file = BaseName(path);
}

LineReader::LineReader(int fd, const char *name, const Config &config)
  : state_(kUnopened),
    file_name_(name ? std::string(name) : NameFromFD(fd)),
    fd_(fd),
    config_(config),
    // The name of a descriptor says nothing reliable about its contents.
    format_(kNone),
    timed_(false) {
  CheckReadableOrThrow(fd, file_name_);
  decoder_.reset(new Decoder(config.encoding, config.errors));
  stats_.file = BaseName(file_name_);
}

LineReader::~LineReader() {
  Close();
}

bool LineReader::ReadLine(boost::string_ref &line) {
  if (state_ == kClosed) return false;
  try {
    if (state_ == kUnopened) Start();
    bool got = splitter_->Next(line);
    stats_.bytes = splitter_->BytesConsumed();
    if (progress_.get()) progress_->Set(source_->RawAmount());
    if (got) {
      ++stats_.lines;
      return true;
    }
  } catch (...) {
    if (splitter_.get()) stats_.bytes = splitter_->BytesConsumed();
    Finish(false);
    throw;
  }
  Finish(true);
  return false;
}

bool LineReader::ReadLine(std::string &line) {
  boost::string_ref ref;
  if (!ReadLine(ref)) return false;
  line.assign(ref.data(), ref.size());
  return true;
}

void LineReader::Close() {
  switch (state_) {
    case kClosed:
      return;
    case kStreaming:
      Finish(false);
      return;
    case kUnopened:
      fd_.reset();
      decoder_.reset();
      state_ = kClosed;
      return;
  }
}

Stats LineReader::GetStats() const {
  Stats ret(stats_);
  ret.seconds = timed_ ? static_cast<double>(timer_.elapsed().wall) / 1e9 : 0.0;
  return ret;
}

void LineReader::Start() {
  state_ = kStreaming;
  timer_.start();
  timed_ = true;
  std::size_t chunk_size = config_.chunk_size ? config_.chunk_size : DefaultChunkSize(format_);
  uint64_t size = kBadSize;
  if (format_ == kNone) {
    if (fd_.get() == -1) fd_.reset(OpenReadOrThrow(path_.c_str()));
    size = SizeFile(fd_.get());
    source_.reset(new ThreadedChunkSource(fd_.release(), chunk_size));
  } else {
    source_.reset(new CompressedChunkSource(path_, format_, chunk_size));
    if (config_.show_progress) {
      scoped_fd probe(OpenReadOrThrow(path_.c_str()));
      size = SizeFile(probe.get());
    }
  }
  stats_.strategy = source_->Strategy();
  splitter_.reset(new LineSplitter(*source_, *decoder_, config_.strip_cr));
  if (config_.show_progress && size != kBadSize) {
    progress_.reset(new ErsatzProgress(size, config_.show_progress, "Reading " + file_name_));
  }
  if (config_.debug && config_.messages) {
    *config_.messages << "[DEBUG] Begin " << file_name_
      << " format=" << format_
      << " strategy=" << stats_.strategy
      << " chunk_size=" << chunk_size
      << " encoding=" << decoder_->Encoding()
      << " errors=" << DecodeErrorPolicyName(config_.errors) << std::endl;
  }
}

void LineReader::Finish(bool completed) {
  timer_.stop();
  if (progress_.get()) {
    if (completed) {
      progress_->Finished();
    } else {
      progress_->Abandon();
    }
    progress_.reset();
  }
  // The splitter refers to the source and decoder.
  splitter_.reset();
  source_.reset();
  decoder_.reset();
  fd_.reset();
  state_ = kClosed;
  if (config_.debug && config_.messages) {
    *config_.messages << "[DEBUG] End " << file_name_ << (completed ? "" : " (stopped early)")
      << " lines=" << stats_.lines
      << " bytes=" << stats_.bytes
      << boost::timer::format(timer_.elapsed(), 3) << std::flush;
  }
}

} // namespace lineread
