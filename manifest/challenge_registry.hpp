#ifndef MANIFEST_CHALLENGE_REGISTRY_HPP
#define MANIFEST_CHALLENGE_REGISTRY_HPP
#include <memory>
#include <string>

#include "proto/submission.pb.h"

namespace manifest {

// Lookup of the challenges that accept submissions.
class ChallengeRegistry {
 public:
  // Returns true if grader_id grades challenge_id.
  virtual bool Known(const std::string& challenge_id,
                     const std::string& grader_id) const = 0;

  ChallengeRegistry() = default;
  virtual ~ChallengeRegistry() = default;
  ChallengeRegistry(const ChallengeRegistry&) = delete;
  ChallengeRegistry& operator=(const ChallengeRegistry&) = delete;
  ChallengeRegistry(ChallengeRegistry&&) = delete;
  ChallengeRegistry& operator=(ChallengeRegistry&&) = delete;
};

// Registry backed by a fixed list. A challenge without graders accepts any
// grader id.
class StaticChallengeRegistry : public ChallengeRegistry {
 public:
  explicit StaticChallengeRegistry(proto::ChallengeRegistry registry)
      : registry_(std::move(registry)) {}

  bool Known(const std::string& challenge_id,
             const std::string& grader_id) const override;

  // Loads a registry in protobuf text format.
  static std::unique_ptr<StaticChallengeRegistry> Load(
      const std::string& path);

  // Registry with the challenge this starter kit targets.
  static std::unique_ptr<StaticChallengeRegistry> Default();

 private:
  proto::ChallengeRegistry registry_;
};

}  // namespace manifest

#endif
