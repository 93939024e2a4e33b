#include <fcntl.h>
#include <unistd.h>
#include <cstdio>

// Copies the environment of the parent to stdout. Exits 0 if it cannot be
// read.
int main() {
  char path[64];
  snprintf(path, sizeof(path), "/proc/%d/environ", static_cast<int>(getppid()));
  int fd = open(path, O_RDONLY);
  if (fd == -1) return 0;
  char buf[4096];
  ssize_t n = read(fd, buf, sizeof(buf));
  if (n <= 0) return 0;
  fwrite(buf, 1, n, stdout);
  return 1;
}
