#include "sandbox/sandbox.hpp"

#include "glog/logging.h"

namespace sandbox {

const char* ModeName(Mode mode) {
  switch (mode) {
    case Mode::SECCOMP_FILTER:
      return "seccomp";
    case Mode::NAMESPACE_ISOLATION:
      return "namespace";
    case Mode::INSECURE_FALLBACK:
      return "insecure";
  }
  return "unknown";
}

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(Mode mode, Sandbox::create_t create,
                        Sandbox::score_t score) {
  Boxes_()->push_back(Candidate{mode, std::move(create), std::move(score)});
}

Mode Sandbox::Select(const std::vector<Candidate>& candidates) {
  int best_score = 0;
  const Candidate* best = nullptr;
  for (const Candidate& candidate : candidates) {
    int score = candidate.score();
    VLOG(1) << "Sandbox " << ModeName(candidate.mode) << " scored " << score;
    if (score > best_score) {
      best_score = score;
      best = &candidate;
    }
  }
  if (best == nullptr) {
    throw sandbox_unavailable(
        "No secure sandbox available: neither seccomp filtering nor "
        "namespace isolation works on this system. Refusing to run untrusted "
        "code. Pass --allow_insecure_sandbox (or set "
        "ALLOW_INSECURE_SANDBOX=1) to run without isolation, for development "
        "only.");
  }
  if (best->mode == Mode::INSECURE_FALLBACK) {
    LOG(ERROR) << "************************************************************";
    LOG(ERROR) << "* INSECURE SANDBOX MODE: submitted programs run WITHOUT     *";
    LOG(ERROR) << "* syscall filtering or namespace isolation. Development only.*";
    LOG(ERROR) << "* Never enable --allow_insecure_sandbox in production.      *";
    LOG(ERROR) << "************************************************************";
  } else {
    LOG(INFO) << "Using the " << ModeName(best->mode) << " sandbox";
  }
  return best->mode;
}

Mode Sandbox::Resolve() {
  static const Mode mode = Select(*Boxes_());
  return mode;
}

std::unique_ptr<Sandbox> Sandbox::Create(Mode mode) {
  for (const Candidate& candidate : *Boxes_()) {
    if (candidate.mode == mode) {
      return std::unique_ptr<Sandbox>(candidate.create());
    }
  }
  throw std::logic_error(std::string("No sandbox registered for mode ") +
                         ModeName(mode));
}

}  // namespace sandbox
