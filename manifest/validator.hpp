#ifndef MANIFEST_VALIDATOR_HPP
#define MANIFEST_VALIDATOR_HPP
#include <string>

#include "manifest/challenge_registry.hpp"
#include "manifest/errors.hpp"
#include "proto/submission.pb.h"

namespace manifest {

// Name of the manifest and of the runtime descriptor in a submission.
static const constexpr char* kManifestFile = "aicrowd.json";
static const constexpr char* kRuntimeFile = "environment.yml";

struct ValidatedSubmission {
  proto::SubmissionManifest manifest;
  proto::RuntimeDescriptor runtime;
};

// Parses aicrowd.json. Unknown keys are ignored. Throws malformed_manifest if
// the contents are not a JSON object with fields of the expected types.
proto::SubmissionManifest ParseManifest(const std::string& raw_manifest);

// Validates the manifest and the runtime descriptor of a submission, in this
// order: manifest syntax, required fields (challenge_id, grader_id, authors),
// registry lookup, runtime descriptor. Throws the validation_error subclass
// of the first failed check. An empty raw_runtime means no dependencies.
ValidatedSubmission Validate(const std::string& raw_manifest,
                             const std::string& raw_runtime,
                             const ChallengeRegistry& registry);

}  // namespace manifest

#endif
