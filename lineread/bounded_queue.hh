#ifndef LINEREAD_BOUNDED_QUEUE__
#define LINEREAD_BOUNDED_QUEUE__

#include "lineread/exception.hh"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

#include <semaphore.h>

namespace lineread {

// POSIX counting semaphore.
class Semaphore {
  public:
    explicit Semaphore(unsigned int value) {
      LINEREAD_THROW_IF(sem_init(&sem_, 0, value), ErrnoException, "Could not create semaphore");
    }

    ~Semaphore() {
      if (-1 == sem_destroy(&sem_)) {
        std::cerr << "Could not destroy semaphore" << std::endl;
      }
    }

    void wait() {
      while (-1 == sem_wait(&sem_)) {
        LINEREAD_THROW_IF(errno != EINTR, ErrnoException, "Wait for semaphore failed");
      }
    }

    // Decrement if that can be done without blocking.
    bool try_wait() {
      while (-1 == sem_trywait(&sem_)) {
        if (errno == EAGAIN) return false;
        LINEREAD_THROW_IF(errno != EINTR, ErrnoException, "Wait for semaphore failed");
      }
      return true;
    }

    void post() {
      LINEREAD_THROW_IF(-1 == sem_post(&sem_), ErrnoException, "Could not post to semaphore");
    }

  private:
    sem_t sem_;

    Semaphore(const Semaphore &);
    Semaphore &operator=(const Semaphore &);
};

/**
 * Fixed capacity producer consumer queue.  Produce blocks while the queue is
 * full and Consume blocks while it is empty, so a fast producer can never be
 * more than size entries ahead of its consumer.  Values are swapped in and
 * out rather than copied: after ProduceSwap the caller holds whatever stale
 * value occupied the slot, never the value it handed over.
 * T must be default constructable and swappable.
 */
template <class T> class BoundedQueue {
  public:
    explicit BoundedQueue(std::size_t size)
      : empty_(size), used_(0),
        storage_(new T[size]),
        end_(storage_.get() + size),
        produce_at_(storage_.get()),
        consume_at_(storage_.get()) {}

    void ProduceSwap(T &val) {
      empty_.wait();
      {
        std::lock_guard<std::mutex> produce_lock(produce_at_mutex_);
        try {
          std::swap(*produce_at_, val);
        } catch (...) {
          empty_.post();
          throw;
        }
        if (++produce_at_ == end_) produce_at_ = storage_.get();
      }
      used_.post();
    }

    T &ConsumeSwap(T &out) {
      used_.wait();
      Take(out);
      return out;
    }

    // Returns false immediately if the queue is empty.
    bool TryConsumeSwap(T &out) {
      if (!used_.try_wait()) return false;
      Take(out);
      return true;
    }

  private:
    void Take(T &out) {
      {
        std::lock_guard<std::mutex> consume_lock(consume_at_mutex_);
        try {
          std::swap(out, *consume_at_);
        } catch (...) {
          used_.post();
          throw;
        }
        if (++consume_at_ == end_) consume_at_ = storage_.get();
      }
      empty_.post();
    }

    // Number of empty spaces in storage_.
    Semaphore empty_;
    // Number of occupied spaces in storage_.
    Semaphore used_;

    std::unique_ptr<T[]> storage_;

    T *const end_;

    // Next write in storage_.
    T *produce_at_;
    std::mutex produce_at_mutex_;

    // Next read from storage_.
    T *consume_at_;
    std::mutex consume_at_mutex_;

    BoundedQueue(const BoundedQueue &);
    BoundedQueue &operator=(const BoundedQueue &);
};

} // namespace lineread

#endif // LINEREAD_BOUNDED_QUEUE__
