#include "sandbox/sandbox.hpp"

#include <utility>

#include "glog/logging.h"
#include "sandbox/unix.hpp"

namespace sandbox {

namespace {
using store_t = std::vector<std::pair<Sandbox::create_t, Sandbox::score_t>>;

const store_t& Boxes() {
  static const store_t boxes = {
      {&Unix::Create, &Unix::Score},
  };
  return boxes;
}
}  // namespace

std::unique_ptr<Sandbox> Sandbox::Create() {
  const store_t& boxes = Boxes();
  int best_score = 0;
  int best_sandbox = -1;
  for (size_t i = 0; i < boxes.size(); i++) {
    int score = boxes[i].second();
    if (score > best_score) {
      best_score = score;
      best_sandbox = i;
    }
  }
  if (best_sandbox == -1) {
    LOG(ERROR) << "No sandbox could be found";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(boxes[best_sandbox].first());
}

}  // namespace sandbox
