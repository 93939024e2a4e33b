#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

// Exits with 0 if creating a file is refused with EACCES.
int main() {
  int fd = open("created.txt", O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd != -1) {
    close(fd);
    return 1;
  }
  return errno == EACCES ? 0 : 2;
}
