#include "manifest/validator.hpp"

#include <algorithm>

#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manifest/runtime_parser.hpp"
#include "util/misc.hpp"

namespace manifest {

proto::SubmissionManifest ParseManifest(const std::string& raw_manifest) {
  proto::SubmissionManifest manifest;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(
      raw_manifest, &manifest, options);
  if (!status.ok()) {
    throw malformed_manifest(status.ToString());
  }
  return manifest;
}

ValidatedSubmission Validate(const std::string& raw_manifest,
                             const std::string& raw_runtime,
                             const ChallengeRegistry& registry) {
  ValidatedSubmission validated;
  validated.manifest = ParseManifest(raw_manifest);
  const proto::SubmissionManifest& manifest = validated.manifest;

  if (util::Trim(manifest.challenge_id()).empty())
    throw missing_field("challenge_id");
  if (util::Trim(manifest.grader_id()).empty())
    throw missing_field("grader_id");
  if (manifest.authors_size() == 0 ||
      std::any_of(manifest.authors().begin(), manifest.authors().end(),
                  [](const std::string& author) {
                    return util::Trim(author).empty();
                  })) {
    throw missing_field("authors");
  }

  if (!registry.Known(manifest.challenge_id(), manifest.grader_id())) {
    throw unknown_challenge(manifest.challenge_id(), manifest.grader_id());
  }

  validated.runtime = ParseRuntime(raw_runtime);
  VLOG(1) << "Validated submission for " << manifest.challenge_id() << " with "
          << validated.runtime.dependency_size() << " dependencies";
  return validated;
}

}  // namespace manifest
