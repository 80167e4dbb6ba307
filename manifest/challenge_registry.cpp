#include "manifest/challenge_registry.hpp"

#include <algorithm>
#include <stdexcept>

#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "util/file.hpp"

namespace manifest {

namespace {
const char* const kDefaultRegistry = R"(
challenge {
  challenge_id: "aicrowd-neurips-2019-disentanglement-challenge"
  grader_id: "aicrowd-neurips-2019-disentanglement-challenge"
}
)";

std::unique_ptr<StaticChallengeRegistry> Parse(const std::string& text,
                                               const std::string& source) {
  proto::ChallengeRegistry registry;
  if (!google::protobuf::TextFormat::ParseFromString(text, &registry)) {
    throw std::runtime_error("Invalid challenge registry " + source);
  }
  VLOG(1) << "Loaded " << registry.challenge_size() << " challenges from "
          << source;
  return std::unique_ptr<StaticChallengeRegistry>(
      new StaticChallengeRegistry(std::move(registry)));
}
}  // namespace

bool StaticChallengeRegistry::Known(const std::string& challenge_id,
                                    const std::string& grader_id) const {
  for (const proto::Challenge& challenge : registry_.challenge()) {
    if (challenge.challenge_id() != challenge_id) continue;
    if (challenge.grader_id_size() == 0) return true;
    if (std::find(challenge.grader_id().begin(), challenge.grader_id().end(),
                  grader_id) != challenge.grader_id().end())
      return true;
  }
  return false;
}

std::unique_ptr<StaticChallengeRegistry> StaticChallengeRegistry::Load(
    const std::string& path) {
  return Parse(util::File::ReadAll(path), path);
}

std::unique_ptr<StaticChallengeRegistry> StaticChallengeRegistry::Default() {
  return Parse(kDefaultRegistry, "the built-in registry");
}

}  // namespace manifest
