#ifndef MANIFEST_ERRORS_HPP
#define MANIFEST_ERRORS_HPP
#include <stdexcept>
#include <string>

#include "proto/execution.pb.h"

namespace manifest {

// Base class of every error that rejects a submission before building it.
class validation_error : public std::runtime_error {
 public:
  explicit validation_error(const std::string& msg)
      : std::runtime_error(msg) {}
  virtual proto::ErrorKind Kind() const = 0;
};

class missing_field : public validation_error {
 public:
  explicit missing_field(std::string field)
      : validation_error("Missing required field: " + field),
        field_(std::move(field)) {}
  proto::ErrorKind Kind() const override { return proto::MISSING_FIELD; }
  const std::string& Field() const { return field_; }

 private:
  std::string field_;
};

class unknown_challenge : public validation_error {
 public:
  unknown_challenge(const std::string& challenge_id,
                    const std::string& grader_id)
      : validation_error("Unknown challenge " + challenge_id + " (grader " +
                         grader_id + ")") {}
  proto::ErrorKind Kind() const override { return proto::UNKNOWN_CHALLENGE; }
};

class malformed_runtime : public validation_error {
 public:
  explicit malformed_runtime(const std::string& msg)
      : validation_error("Malformed runtime descriptor: " + msg) {}
  proto::ErrorKind Kind() const override { return proto::MALFORMED_RUNTIME; }
};

class malformed_manifest : public validation_error {
 public:
  explicit malformed_manifest(const std::string& msg)
      : validation_error("Malformed manifest: " + msg) {}
  proto::ErrorKind Kind() const override { return proto::MALFORMED_MANIFEST; }
};

}  // namespace manifest

#endif
