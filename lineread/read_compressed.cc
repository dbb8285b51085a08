#include "lineread/read_compressed.hh"

#include "lineread/file.hh"
#include "lineread/scoped.hh"

#include <algorithm>
#include <iostream>
#include <limits>
#include <new>

#include <assert.h>
#include <string.h>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

namespace lineread {

CompressedException::CompressedException() throw() {}
CompressedException::~CompressedException() throw() {}

GZException::GZException() throw() {}
GZException::~GZException() throw() {}

BZException::BZException() throw() {}
BZException::~BZException() throw() {}

XZException::XZException() throw() {}
XZException::~XZException() throw() {}

class ReadBase {
  public:
    virtual ~ReadBase() {}

    virtual std::size_t Read(void *to, std::size_t amount, ReadCompressed &thunk) = 0;

  protected:
    // Deletes the caller.  Only return after calling this.
    static void ReplaceThis(ReadBase *with, ReadCompressed &thunk) {
      thunk.internal_.reset(with);
    }

    static uint64_t &ReadCount(ReadCompressed &thunk) {
      return thunk.raw_amount_;
    }
};

namespace {

// Finished stream that the others replace themselves with.
class Complete : public ReadBase {
  public:
    std::size_t Read(void *, std::size_t, ReadCompressed &) {
      return 0;
    }
};

class Uncompressed : public ReadBase {
  public:
    explicit Uncompressed(int fd) : fd_(fd) {}

    std::size_t Read(void *to, std::size_t amount, ReadCompressed &thunk) {
      std::size_t got = PartialRead(fd_.get(), to, amount);
      ReadCount(thunk) += got;
      return got;
    }

  private:
    scoped_fd fd_;
};

// Owns the compressed file and a buffer of raw input for the engines.
class EngineBase : public ReadBase {
  protected:
    static const std::size_t kInputBuffer = 16384;

    explicit EngineBase(int fd) : file_(fd), in_buffer_(MallocOrThrow(kInputBuffer)) {}

    // A zero-byte file decompresses to nothing rather than being truncated.
    static bool NothingRead(ReadCompressed &thunk) {
      return !ReadCount(thunk);
    }

    // Returns the number of raw bytes now at in_buffer_, zero at end of file.
    std::size_t Refill(ReadCompressed &thunk) {
      std::size_t got = ReadOrEOF(file_.get(), in_buffer_.get(), kInputBuffer);
      ReadCount(thunk) += got;
      return got;
    }

    scoped_fd file_;
    scoped_malloc in_buffer_;
};

class GZip : public EngineBase {
  public:
    explicit GZip(int fd) : EngineBase(fd) {
      memset(&stream_, 0, sizeof(stream_));
      stream_.zalloc = Z_NULL;
      stream_.zfree = Z_NULL;
      stream_.opaque = Z_NULL;
      stream_.next_in = Z_NULL;
      stream_.avail_in = 0;
      // 32 for zlib and gzip decoding with automatic header detection.
      // 15 for maximum window size.
      LINEREAD_THROW_IF(Z_OK != inflateInit2(&stream_, 32 + 15), GZException, "Failed to initialize zlib.");
    }

    ~GZip() {
      if (Z_OK != inflateEnd(&stream_)) {
        std::cerr << "zlib could not close properly." << std::endl;
      }
    }

    std::size_t Read(void *to, std::size_t amount, ReadCompressed &thunk) {
      if (amount == 0) return 0;
      stream_.next_out = static_cast<Bytef*>(to);
      stream_.avail_out = std::min<std::size_t>(std::numeric_limits<uInt>::max(), amount);
      do {
        if (!stream_.avail_in && !ReadInput(thunk)) {
          if (NothingRead(thunk)) {
            ReplaceThis(new Complete(), thunk);
            return 0;
          }
          LINEREAD_THROW(GZException, "gzip input ended in the middle of a member");
        }
        int result = inflate(&stream_, Z_NO_FLUSH);
        switch (result) {
          case Z_OK:
            break;
          case Z_STREAM_END:
            if (!SkipPadding(thunk)) {
              std::size_t ret = static_cast<uint8_t*>(stream_.next_out) - static_cast<uint8_t*>(to);
              ReplaceThis(new Complete(), thunk);
              return ret;
            }
            // Another member follows, as written by cat a.gz b.gz.
            LINEREAD_THROW_IF(Z_OK != inflateReset(&stream_), GZException, "Failed to reset zlib for the next member.");
            break;
          case Z_MEM_ERROR:
            throw std::bad_alloc();
          case Z_ERRNO:
            LINEREAD_THROW(ErrnoException, "zlib error");
          default:
            LINEREAD_THROW(GZException, "zlib encountered " << (stream_.msg ? stream_.msg : "an error ") << " code " << result);
        }
      } while (stream_.next_out == to);
      return static_cast<uint8_t*>(stream_.next_out) - static_cast<uint8_t*>(to);
    }

  private:
    std::size_t ReadInput(ReadCompressed &thunk) {
      assert(!stream_.avail_in);
      stream_.next_in = static_cast<Bytef*>(in_buffer_.get());
      stream_.avail_in = Refill(thunk);
      return stream_.avail_in;
    }

    // Block and tape writers pad with NULs after the last member.  Returns
    // false if only padding was left.
    bool SkipPadding(ReadCompressed &thunk) {
      while (true) {
        while (stream_.avail_in && !*stream_.next_in) {
          ++stream_.next_in;
          --stream_.avail_in;
        }
        if (stream_.avail_in) return true;
        if (!ReadInput(thunk)) return false;
      }
    }

    z_stream stream_;
};

class BZip : public EngineBase {
  public:
    explicit BZip(int fd) : EngineBase(fd) {
      memset(&stream_, 0, sizeof(stream_));
      Init();
    }

    ~BZip() {
      BZ2_bzDecompressEnd(&stream_);
    }

    std::size_t Read(void *to, std::size_t amount, ReadCompressed &thunk) {
      if (amount == 0) return 0;
      stream_.next_out = static_cast<char*>(to);
      stream_.avail_out = std::min<std::size_t>(std::numeric_limits<unsigned int>::max(), amount);
      do {
        if (!stream_.avail_in && !ReadInput(thunk)) {
          if (NothingRead(thunk)) {
            ReplaceThis(new Complete(), thunk);
            return 0;
          }
          LINEREAD_THROW(BZException, "bzip2 input ended in the middle of a stream");
        }
        int result = BZ2_bzDecompress(&stream_);
        switch (result) {
          case BZ_OK:
            break;
          case BZ_STREAM_END:
            if (!stream_.avail_in && !ReadInput(thunk)) {
              std::size_t ret = stream_.next_out - static_cast<char*>(to);
              ReplaceThis(new Complete(), thunk);
              return ret;
            }
            // pbzip2 and cat write several streams back to back.
            Restart();
            break;
          case BZ_MEM_ERROR:
            throw std::bad_alloc();
          case BZ_DATA_ERROR_MAGIC:
            LINEREAD_THROW(BZException, "bzip2 magic number missing; trailing data is not another bzip2 stream");
          case BZ_DATA_ERROR:
            LINEREAD_THROW(BZException, "bzip2 data integrity error");
          default:
            LINEREAD_THROW(BZException, "bzip2 error code " << result);
        }
      } while (stream_.next_out == to);
      return stream_.next_out - static_cast<char*>(to);
    }

  private:
    void Init() {
      int ret = BZ2_bzDecompressInit(&stream_, 0, 0);
      switch (ret) {
        case BZ_OK:
          return;
        case BZ_CONFIG_ERROR:
          LINEREAD_THROW(BZException, "Looks like bzip2 was miscompiled.");
        case BZ_MEM_ERROR:
          throw std::bad_alloc();
        default:
          LINEREAD_THROW(BZException, "Unknown bzip2 error code " << ret);
      }
    }

    // Start decoding a new stream without losing buffered input or output position.
    void Restart() {
      char *next_in = stream_.next_in;
      unsigned int avail_in = stream_.avail_in;
      char *next_out = stream_.next_out;
      unsigned int avail_out = stream_.avail_out;
      BZ2_bzDecompressEnd(&stream_);
      memset(&stream_, 0, sizeof(stream_));
      Init();
      stream_.next_in = next_in;
      stream_.avail_in = avail_in;
      stream_.next_out = next_out;
      stream_.avail_out = avail_out;
    }

    std::size_t ReadInput(ReadCompressed &thunk) {
      assert(!stream_.avail_in);
      stream_.next_in = static_cast<char*>(in_buffer_.get());
      stream_.avail_in = Refill(thunk);
      return stream_.avail_in;
    }

    bz_stream stream_;
};

class XZip : public EngineBase {
  public:
    // Either container, whatever the file is called: .xz streams or legacy
    // LZMA_Alone, one after another.
    explicit XZip(int fd) : EngineBase(fd), stream_(), action_(LZMA_RUN) {
      lzma_stream init = LZMA_STREAM_INIT;
      stream_ = init;
      Init();
    }

    ~XZip() {
      lzma_end(&stream_);
    }

    std::size_t Read(void *to, std::size_t amount, ReadCompressed &thunk) {
      if (amount == 0) return 0;
      stream_.next_out = static_cast<uint8_t*>(to);
      stream_.avail_out = amount;
      do {
        if (!stream_.avail_in && action_ == LZMA_RUN) {
          ReadInput(thunk);
          if (action_ == LZMA_FINISH && NothingRead(thunk)) {
            ReplaceThis(new Complete(), thunk);
            return 0;
          }
        }
        lzma_ret status = lzma_code(&stream_, action_);
        switch (status) {
          case LZMA_OK:
            break;
          case LZMA_STREAM_END:
            if (!SkipPadding(thunk)) {
              std::size_t ret = static_cast<uint8_t*>(stream_.next_out) - static_cast<uint8_t*>(to);
              ReplaceThis(new Complete(), thunk);
              return ret;
            }
            // Another stream follows.  Anything else fails the format check.
            Init();
            break;
          case LZMA_MEM_ERROR:
            throw std::bad_alloc();
          case LZMA_FORMAT_ERROR:
            LINEREAD_THROW(XZException, "xzlib says file format not recognized");
          case LZMA_OPTIONS_ERROR:
            LINEREAD_THROW(XZException, "xzlib says unsupported compression options");
          case LZMA_DATA_ERROR:
            LINEREAD_THROW(XZException, "xzlib says this file is corrupt");
          case LZMA_BUF_ERROR:
            LINEREAD_THROW(XZException, "xzlib says unexpected end of input");
          default:
            LINEREAD_THROW(XZException, "unrecognized xzlib error " << status);
        }
      } while (stream_.next_out == to);
      return static_cast<uint8_t*>(stream_.next_out) - static_cast<uint8_t*>(to);
    }

  private:
    // Also restarts on an existing stream without touching buffered input.
    void Init() {
      lzma_ret ret = lzma_auto_decoder(&stream_, UINT64_MAX, 0);
      switch (ret) {
        case LZMA_OK:
          return;
        case LZMA_MEM_ERROR:
          throw std::bad_alloc();
        default:
          LINEREAD_THROW(XZException, "xz error code " << ret << " initializing the decoder");
      }
    }

    std::size_t ReadInput(ReadCompressed &thunk) {
      assert(!stream_.avail_in);
      stream_.next_in = static_cast<const uint8_t*>(in_buffer_.get());
      stream_.avail_in = Refill(thunk);
      if (!stream_.avail_in) action_ = LZMA_FINISH;
      return stream_.avail_in;
    }

    // xz stream padding is NULs.  LZMA_Alone headers start with the
    // properties byte, 0x5D for every preset.  Returns false at the end.
    bool SkipPadding(ReadCompressed &thunk) {
      while (true) {
        while (stream_.avail_in && !*stream_.next_in) {
          ++stream_.next_in;
          --stream_.avail_in;
        }
        if (stream_.avail_in) return true;
        if (action_ == LZMA_FINISH || !ReadInput(thunk)) return false;
      }
    }

    lzma_stream stream_;

    lzma_action action_;
};

ReadBase *ReadFactory(int fd, Format format) {
  scoped_fd hold(fd);
  switch (format) {
    case kNone:
      return new Uncompressed(hold.release());
    case kGzip:
      return new GZip(hold.release());
    case kBzip2:
      return new BZip(hold.release());
    case kXz:
    case kLzma:
      return new XZip(hold.release());
  }
  LINEREAD_THROW(ConfigurationException, "Unsupported compression format " << static_cast<int>(format));
}

} // namespace

ReadCompressed::ReadCompressed(int fd, Format format) : raw_amount_(0) {
  internal_.reset(ReadFactory(fd, format));
}

ReadCompressed::~ReadCompressed() {}

std::size_t ReadCompressed::Read(void *to, std::size_t amount) {
  return internal_->Read(to, amount, *this);
}

} // namespace lineread
