#ifndef BUILDER_ERRORS_HPP
#define BUILDER_ERRORS_HPP
#include <stdexcept>
#include <string>

#include "proto/execution.pb.h"

namespace builder {

// Base class of every error that makes a build attempt fail.
class build_error : public std::runtime_error {
 public:
  explicit build_error(const std::string& msg) : std::runtime_error(msg) {}
  virtual proto::ErrorKind Kind() const = 0;
};

class unresolvable_dependency : public build_error {
 public:
  explicit unresolvable_dependency(std::string name,
                                   const std::string& detail = "")
      : build_error("Unresolvable dependency: " + name +
                    (detail.empty() ? "" : " (" + detail + ")")),
        name_(std::move(name)) {}
  proto::ErrorKind Kind() const override {
    return proto::UNRESOLVABLE_DEPENDENCY;
  }
  const std::string& Name() const { return name_; }

 private:
  std::string name_;
};

class entrypoint_missing : public build_error {
 public:
  explicit entrypoint_missing(const std::string& path)
      : build_error("Entrypoint missing: " + path) {}
  proto::ErrorKind Kind() const override { return proto::ENTRYPOINT_MISSING; }
};

class privilege_violation : public build_error {
 public:
  explicit privilege_violation(const std::string& msg)
      : build_error("Privilege violation: " + msg) {}
  proto::ErrorKind Kind() const override { return proto::PRIVILEGE_VIOLATION; }
};

// The runtime could not build the image, e.g. because a pinned package is
// not available or the build took too long.
class image_build_failed : public build_error {
 public:
  explicit image_build_failed(const std::string& msg)
      : build_error("Image build failed: " + msg) {}
  proto::ErrorKind Kind() const override { return proto::IMAGE_BUILD_FAILED; }
};

}  // namespace builder

#endif
