#include "builder/resolver.hpp"

#include <algorithm>
#include <vector>

#include "builder/errors.hpp"
#include "builder/version.hpp"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "manifest/runtime_parser.hpp"
#include "util/file.hpp"

namespace {
bool IsPip(const std::string& channel) {
  return channel == manifest::kPipChannel;
}

proto::ResolvedDependency Resolved(const proto::Dependency& dependency,
                                   const std::string& version,
                                   const std::string& channel) {
  proto::ResolvedDependency resolved;
  resolved.set_name(dependency.name());
  resolved.set_version(version);
  resolved.set_channel(channel);
  return resolved;
}
}  // namespace

namespace builder {

proto::ResolvedEnvironment DependencyResolver::ResolveAll(
    const proto::RuntimeDescriptor& descriptor,
    const std::string& base_image) const {
  proto::ResolvedEnvironment environment;
  environment.set_base_image(base_image);
  for (const proto::Dependency& dependency : descriptor.dependency()) {
    *environment.add_dependency() = Resolve(dependency, descriptor);
    VLOG(1) << "Resolved " << dependency.name() << dependency.constraint()
            << " to " << environment.dependency().rbegin()->version();
  }
  return environment;
}

IndexResolver::IndexResolver(const proto::PackageIndex& index) {
  // Names are stored in canonical form, so that lookups are exact.
  for (const proto::PackageIndex::Package& package : index.package()) {
    proto::PackageIndex::Package* copy = index_.add_package();
    *copy = package;
    copy->set_name(
        manifest::CanonicalName(package.name(), IsPip(package.channel())));
  }
}

std::unique_ptr<IndexResolver> IndexResolver::Load(const std::string& path) {
  proto::PackageIndex index;
  if (!google::protobuf::TextFormat::ParseFromString(util::File::ReadAll(path),
                                                     &index)) {
    throw std::runtime_error("Invalid package index " + path);
  }
  LOG(INFO) << "Loaded " << index.package_size() << " packages from " << path;
  return std::unique_ptr<IndexResolver>(new IndexResolver(index));
}

proto::ResolvedDependency IndexResolver::Resolve(
    const proto::Dependency& dependency,
    const proto::RuntimeDescriptor& descriptor) const {
  const bool pip = IsPip(dependency.channel());
  std::vector<std::string> channels;
  if (!dependency.channel().empty()) {
    channels.push_back(dependency.channel());
  } else {
    for (const std::string& channel : descriptor.channels())
      channels.push_back(channel);
    for (const proto::PackageIndex::Package& package : index_.package()) {
      if (IsPip(package.channel())) continue;
      if (std::find(channels.begin(), channels.end(), package.channel()) ==
          channels.end())
        channels.push_back(package.channel());
    }
  }

  const std::string pin = ExactPin(dependency.constraint());
  for (const std::string& channel : channels) {
    if (IsPip(channel) != pip) continue;
    const std::string* best = nullptr;
    for (const proto::PackageIndex::Package& package : index_.package()) {
      if (package.channel() != channel || package.name() != dependency.name())
        continue;
      for (const std::string& version : package.version()) {
        bool ok = false;
        try {
          ok = pin.empty() ? Satisfies(version, dependency.constraint())
                           : version == pin;
        } catch (const std::invalid_argument& exc) {
          throw unresolvable_dependency(dependency.name(), exc.what());
        }
        if (!ok) continue;
        if (best == nullptr || CompareVersions(version, *best) > 0)
          best = &version;
      }
    }
    if (best != nullptr) return Resolved(dependency, *best, channel);
  }
  throw unresolvable_dependency(
      dependency.name(),
      dependency.constraint().empty()
          ? "not in the package index"
          : "no version satisfies " + dependency.constraint());
}

proto::ResolvedDependency PinResolver::Resolve(
    const proto::Dependency& dependency,
    const proto::RuntimeDescriptor& descriptor) const {
  const std::string pin = ExactPin(dependency.constraint());
  if (pin.empty()) {
    throw unresolvable_dependency(dependency.name(),
                                  "only exact pins can be resolved without a "
                                  "package index");
  }
  std::string channel = dependency.channel();
  if (channel.empty()) {
    channel = descriptor.channels_size() ? descriptor.channels(0) : "defaults";
  }
  return Resolved(dependency, pin, channel);
}

}  // namespace builder
