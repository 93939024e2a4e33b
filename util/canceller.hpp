#ifndef UTIL_CANCELLER_HPP
#define UTIL_CANCELLER_HPP

#include <atomic>

namespace util {

// One-shot cancellation signal that can be waited on with poll(). Cancel()
// may be called from any thread, any number of times; after the first call
// Fd() stays readable forever.
class Canceller {
 public:
  Canceller();
  ~Canceller();

  void Cancel();
  bool Cancelled() const { return cancelled_; }
  int Fd() const { return fds_[0]; }

  Canceller(const Canceller&) = delete;
  Canceller& operator=(const Canceller&) = delete;
  Canceller(Canceller&&) = delete;
  Canceller& operator=(Canceller&&) = delete;

 private:
  int fds_[2] = {-1, -1};
  std::atomic<bool> cancelled_{false};
};

}  // namespace util

#endif
