#ifndef LINEREAD_EXCEPTION__
#define LINEREAD_EXCEPTION__

#include <exception>
#include <sstream>
#include <string>

#include <stdint.h>

namespace lineread {

template <class Except, class Data> typename Except::template ExceptionTag<Except&>::Identity operator<<(Except &e, const Data &data);

class Exception : public std::exception {
  public:
    Exception() throw();
    virtual ~Exception() throw();

    Exception(const Exception &from);
    Exception &operator=(const Exception &from);

    // Not threadsafe.  Exceptions that cross threads are rethrown, not shared.
    const char *what() const throw();

    // For use by the LINEREAD_THROW macros.
    void SetLocation(
        const char *file,
        unsigned int line,
        const char *func,
        const char *child_name,
        const char *condition);

  private:
    template <class Except, class Data> friend typename Except::template ExceptionTag<Except&>::Identity operator<<(Except &e, const Data &data);

    // Restricts operator<< below to Exception and its children.
    template <class T> struct ExceptionTag {
      typedef T Identity;
    };

    std::stringstream stream_;
    mutable std::string text_;
};

template <class Except, class Data> typename Except::template ExceptionTag<Except&>::Identity operator<<(Except &e, const Data &data) {
  e.stream_ << data;
  return e;
}

#ifdef __GNUC__
#define LINEREAD_FUNC_NAME __PRETTY_FUNCTION__
#else
#ifdef _WIN32
#define LINEREAD_FUNC_NAME __FUNCTION__
#else
#define LINEREAD_FUNC_NAME NULL
#endif
#endif

/* Create an instance of Exception, add the message Modify, and throw it.
 * Modify is appended to the what() message and can contain << for ostream
 * operations.  Arg can be a constructor argument to the exception.
 */
#define LINEREAD_THROW_BACKEND(Condition, Exception, Arg, Modify) do { \
  Exception LINEREAD_e Arg; \
  LINEREAD_e.SetLocation(__FILE__, __LINE__, LINEREAD_FUNC_NAME, #Exception, Condition); \
  LINEREAD_e << Modify; \
  throw LINEREAD_e; \
} while (0)

#define LINEREAD_THROW_ARG(Exception, Arg, Modify) \
  LINEREAD_THROW_BACKEND(NULL, Exception, Arg, Modify)

#define LINEREAD_THROW(Exception, Modify) \
  LINEREAD_THROW_BACKEND(NULL, Exception, , Modify)

#if __GNUC__ >= 3
#define LINEREAD_UNLIKELY(x) __builtin_expect (!!(x), 0)
#else
#define LINEREAD_UNLIKELY(x) (x)
#endif

#define LINEREAD_THROW_IF_ARG(Condition, Exception, Arg, Modify) do { \
  if (LINEREAD_UNLIKELY(Condition)) { \
    LINEREAD_THROW_BACKEND(#Condition, Exception, Arg, Modify); \
  } \
} while (0)

#define LINEREAD_THROW_IF(Condition, Exception, Modify) \
  LINEREAD_THROW_IF_ARG(Condition, Exception, , Modify)

// Exception that records errno and adds it to the message.
class ErrnoException : public Exception {
  public:
    ErrnoException() throw();

    virtual ~ErrnoException() throw();

    int Error() const throw() { return errno_; }

  private:
    int errno_;
};

// The reader was set up in a way that can never work: a descriptor that
// can't be read, an unknown encoding, a compressed read without a path.
// Always thrown before any line is returned.
class ConfigurationException : public Exception {
  public:
    ConfigurationException() throw();
    ~ConfigurationException() throw();
};

// Malformed input for the configured encoding under the strict policy.
class DecodeException : public Exception {
  public:
    explicit DecodeException(uint64_t offset) throw();
    ~DecodeException() throw();

    // Approximate byte offset into the decompressed stream.
    uint64_t Offset() const { return offset_; }

  private:
    uint64_t offset_;
};

} // namespace lineread

#endif // LINEREAD_EXCEPTION__
