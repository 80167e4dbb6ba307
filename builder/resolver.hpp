#ifndef BUILDER_RESOLVER_HPP
#define BUILDER_RESOLVER_HPP
#include <memory>
#include <string>

#include "proto/image.pb.h"
#include "proto/submission.pb.h"

namespace builder {

// Pins a dependency of a runtime descriptor to a concrete version.
class DependencyResolver {
 public:
  // Throws unresolvable_dependency if nothing satisfies the dependency.
  virtual proto::ResolvedDependency Resolve(
      const proto::Dependency& dependency,
      const proto::RuntimeDescriptor& descriptor) const = 0;

  // Resolves every dependency of descriptor, in order.
  proto::ResolvedEnvironment ResolveAll(
      const proto::RuntimeDescriptor& descriptor,
      const std::string& base_image) const;

  DependencyResolver() = default;
  virtual ~DependencyResolver() = default;
  DependencyResolver(const DependencyResolver&) = delete;
  DependencyResolver& operator=(const DependencyResolver&) = delete;
  DependencyResolver(DependencyResolver&&) = delete;
  DependencyResolver& operator=(DependencyResolver&&) = delete;
};

// Resolves against a snapshot of the available packages. Exact pins must be
// in the snapshot; other constraints pick the highest satisfying version.
// A dependency with a channel is only looked up there; otherwise the
// channels of the descriptor are tried in order, then every other channel.
class IndexResolver : public DependencyResolver {
 public:
  explicit IndexResolver(const proto::PackageIndex& index);

  proto::ResolvedDependency Resolve(
      const proto::Dependency& dependency,
      const proto::RuntimeDescriptor& descriptor) const override;

  // Loads a package index in protobuf text format.
  static std::unique_ptr<IndexResolver> Load(const std::string& path);

 private:
  proto::PackageIndex index_;
};

// Resolver used when no package index is available: accepts exact pins as
// they are and rejects everything else.
class PinResolver : public DependencyResolver {
 public:
  proto::ResolvedDependency Resolve(
      const proto::Dependency& dependency,
      const proto::RuntimeDescriptor& descriptor) const override;
};

}  // namespace builder

#endif
