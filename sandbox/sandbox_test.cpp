#include "sandbox/sandbox.hpp"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using namespace sandbox;

Sandbox::Candidate MakeCandidate(Mode mode, int score) {
  return Sandbox::Candidate{mode, []() -> Sandbox* { return nullptr; },
                            [score]() { return score; }};
}

TEST(SandboxTest, TestHighestScoreWins) {
  std::vector<Sandbox::Candidate> candidates = {
      MakeCandidate(Mode::INSECURE_FALLBACK, 1),
      MakeCandidate(Mode::SECCOMP_FILTER, 3),
      MakeCandidate(Mode::NAMESPACE_ISOLATION, 2)};
  EXPECT_EQ(Sandbox::Select(candidates), Mode::SECCOMP_FILTER);
}

TEST(SandboxTest, TestNegativeScoresAreSkipped) {
  std::vector<Sandbox::Candidate> candidates = {
      MakeCandidate(Mode::SECCOMP_FILTER, -1),
      MakeCandidate(Mode::NAMESPACE_ISOLATION, 2),
      MakeCandidate(Mode::INSECURE_FALLBACK, -1)};
  EXPECT_EQ(Sandbox::Select(candidates), Mode::NAMESPACE_ISOLATION);
}

TEST(SandboxTest, TestInsecureOnlyWhenAlone) {
  std::vector<Sandbox::Candidate> candidates = {
      MakeCandidate(Mode::SECCOMP_FILTER, -1),
      MakeCandidate(Mode::NAMESPACE_ISOLATION, -1),
      MakeCandidate(Mode::INSECURE_FALLBACK, 1)};
  EXPECT_EQ(Sandbox::Select(candidates), Mode::INSECURE_FALLBACK);
}

TEST(SandboxTest, TestNothingAvailable) {
  std::vector<Sandbox::Candidate> candidates = {
      MakeCandidate(Mode::SECCOMP_FILTER, -1),
      MakeCandidate(Mode::NAMESPACE_ISOLATION, -1),
      MakeCandidate(Mode::INSECURE_FALLBACK, -1)};
  EXPECT_THROW(Sandbox::Select(candidates), sandbox_unavailable);
  EXPECT_THROW(Sandbox::Select({}), sandbox_unavailable);
}

TEST(SandboxTest, TestEveryModeIsRegistered) {
  for (Mode mode : {Mode::SECCOMP_FILTER, Mode::NAMESPACE_ISOLATION,
                    Mode::INSECURE_FALLBACK}) {
    EXPECT_TRUE(Sandbox::Create(mode)) << ModeName(mode);
  }
}

TEST(SandboxTest, TestModeNames) {
  EXPECT_STREQ(ModeName(Mode::SECCOMP_FILTER), "seccomp");
  EXPECT_STREQ(ModeName(Mode::NAMESPACE_ISOLATION), "namespace");
  EXPECT_STREQ(ModeName(Mode::INSECURE_FALLBACK), "insecure");
}

}  // namespace
