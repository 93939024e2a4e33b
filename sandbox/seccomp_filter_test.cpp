#include "sandbox/seccomp_filter.hpp"

#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using sandbox::SeccompFilter;

// Runs body in a child that installed filter first. Returns the wait status.
template <typename Body>
int RunFiltered(SeccompFilter* filter, Body body) {
  pid_t pid = fork();
  if (pid == 0) {
    char buf[256] = {};
    filter->BindPid(getpid());
    if (!filter->Install(buf, sizeof(buf))) _exit(100);
    _exit(body());
  }
  int status = 0;
  while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
  return status;
}

SeccompFilter BaseFilter() {
  SeccompFilter filter;
  filter.Allow(__NR_exit_group);
  filter.Allow(__NR_exit);
  return filter;
}

bool Supported() {
  SeccompFilter filter = BaseFilter();
  filter.Finish();
  int status = RunFiltered(&filter, []() { return 0; });
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

TEST(SeccompFilterTest, TestUnfinishedFilterIsNotInstalled) {
  SeccompFilter filter = BaseFilter();
  char buf[256] = {};
  EXPECT_FALSE(filter.Install(buf, sizeof(buf)));
  EXPECT_THAT(buf, ::testing::HasSubstr("not finished"));
}

TEST(SeccompFilterTest, TestUnlistedSyscallKills) {
  if (!Supported()) GTEST_SKIP() << "seccomp not available";
  SeccompFilter filter = BaseFilter();
  filter.Finish();
  int status = RunFiltered(&filter, []() { return (int)syscall(__NR_getuid); });
  ASSERT_TRUE(WIFSIGNALED(status));
  EXPECT_EQ(WTERMSIG(status), SIGSYS);
}

TEST(SeccompFilterTest, TestFailReturnsErrno) {
  if (!Supported()) GTEST_SKIP() << "seccomp not available";
  SeccompFilter filter = BaseFilter();
  filter.Fail(__NR_getuid, EPERM);
  filter.Finish();
  int status = RunFiltered(&filter, []() {
    long ret = syscall(__NR_getuid);
    return ret == -1 && errno == EPERM ? 0 : 1;
  });
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(SeccompFilterTest, TestArgEquals) {
  if (!Supported()) GTEST_SKIP() << "seccomp not available";
  SeccompFilter filter = BaseFilter();
  // Only the full 64 bit value matches: a low word of 2 is not enough.
  filter.AllowIfArgEquals(__NR_dup, 0, 0x100000002ULL,
                          SeccompFilter::Errno(EPERM));
  filter.Finish();
  int status = RunFiltered(&filter, []() {
    long ret = syscall(__NR_dup, 2UL);
    return ret == -1 && errno == EPERM ? 0 : 1;
  });
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(SeccompFilterTest, TestArgBits) {
  if (!Supported()) GTEST_SKIP() << "seccomp not available";
  SeccompFilter filter = BaseFilter();
  filter.AllowIfArgHasBits(__NR_getpriority, 0, 0x4, SeccompFilter::Errno(EPERM));
  filter.AllowIfArgLacksBits(__NR_umask, 0, 0x2, SeccompFilter::Errno(EACCES));
  filter.Finish();
  int status = RunFiltered(&filter, []() {
    if (!(syscall(__NR_getpriority, 1UL, 0UL) == -1 && errno == EPERM))
      return 1;
    if (syscall(__NR_umask, 0x2UL) != -1 || errno != EACCES) return 2;
    if (syscall(__NR_umask, 0x5UL) == -1) return 3;
    return 0;
  });
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(SeccompFilterTest, TestArgIsOwnPid) {
  if (!Supported()) GTEST_SKIP() << "seccomp not available";
  SeccompFilter filter = BaseFilter();
  filter.Allow(__NR_getpid);
  filter.AllowIfArgIsOwnPid(__NR_kill, 0, SeccompFilter::Errno(EPERM));
  filter.Finish();
  int status = RunFiltered(&filter, []() {
    if (syscall(__NR_kill, 1, 0) != -1 || errno != EPERM) return 1;
    if (syscall(__NR_kill, syscall(__NR_getpid), 0) != 0) return 2;
    return 0;
  });
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(SeccompFilterTest, TestProgramEndsWithKill) {
  SeccompFilter filter = BaseFilter();
  filter.Finish();
  ASSERT_FALSE(filter.Program().empty());
  EXPECT_EQ(filter.Program().back().k, SeccompFilter::kKill);
}

}  // namespace
