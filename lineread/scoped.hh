#ifndef LINEREAD_SCOPED__
#define LINEREAD_SCOPED__
/* Scoped ownership of malloc'd buffers. */

#include "lineread/exception.hh"

#include <cstddef>

namespace lineread {

class MallocException : public ErrnoException {
  public:
    explicit MallocException(std::size_t requested) throw();
    ~MallocException() throw();
};

void *MallocOrThrow(std::size_t requested);

class scoped_malloc {
  public:
    scoped_malloc() : p_(NULL) {}

    explicit scoped_malloc(void *p) : p_(p) {}

    ~scoped_malloc();

    void reset(void *p = NULL) {
      scoped_malloc other(p_);
      p_ = p;
    }

    void *get() { return p_; }
    const void *get() const { return p_; }

  private:
    void *p_;

    scoped_malloc(const scoped_malloc &);
    scoped_malloc &operator=(const scoped_malloc &);
};

} // namespace lineread

#endif // LINEREAD_SCOPED__
