#include "util/canceller.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace util {

Canceller::Canceller() {
  if (pipe2(fds_, O_CLOEXEC | O_NONBLOCK) == -1)
    throw std::system_error(errno, std::system_category(), "pipe2");
}

Canceller::~Canceller() {
  close(fds_[0]);
  close(fds_[1]);
}

void Canceller::Cancel() {
  if (cancelled_.exchange(true)) return;
  char c = 0;
  while (write(fds_[1], &c, 1) == -1 && errno == EINTR) {
  }
}

}  // namespace util
