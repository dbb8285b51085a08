#include "lineread/scoped.hh"

#include <cstdlib>

namespace lineread {

MallocException::MallocException(std::size_t requested) throw() {
  *this << "for " << requested << " bytes ";
}

MallocException::~MallocException() throw() {}

void *MallocOrThrow(std::size_t requested) {
  void *ret = std::malloc(requested);
  LINEREAD_THROW_IF_ARG(!ret && requested, MallocException, (requested), "in malloc");
  return ret;
}

scoped_malloc::~scoped_malloc() {
  std::free(p_);
}

} // namespace lineread
