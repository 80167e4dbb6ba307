#include "builder/resolver.hpp"
#include "builder/errors.hpp"
#include "gmock/gmock.h"
#include "google/protobuf/text_format.h"
#include "gtest/gtest.h"

namespace {

const char* const kIndex = R"(
package { name: "numpy" channel: "defaults" version: "1.15.4" version: "1.16.4" version: "1.17.0" }
package { name: "numpy" channel: "conda-forge" version: "1.18.1" }
package { name: "pytorch" channel: "pytorch" version: "1.1.0" version: "1.2.0" }
package { name: "Torch_Vision" channel: "pypi" version: "0.3.0" version: "0.4.0" }
package { name: "numpy" channel: "pypi" version: "1.19.0" }
)";

proto::Dependency Dep(const std::string& name, const std::string& constraint,
                      const std::string& channel = "") {
  proto::Dependency dependency;
  dependency.set_name(name);
  dependency.set_constraint(constraint);
  dependency.set_channel(channel);
  return dependency;
}

class ResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    proto::PackageIndex index;
    ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(kIndex, &index));
    resolver_.reset(new builder::IndexResolver(index));
  }

  proto::RuntimeDescriptor descriptor_;
  std::unique_ptr<builder::IndexResolver> resolver_;
};

// NOLINTNEXTLINE
TEST_F(ResolverTest, HighestSatisfyingVersion) {
  descriptor_.add_channels("defaults");
  auto resolved = resolver_->Resolve(Dep("numpy", ">=1.15,<1.17"), descriptor_);
  EXPECT_EQ(resolved.version(), "1.16.4");
  EXPECT_EQ(resolved.channel(), "defaults");
}

// NOLINTNEXTLINE
TEST_F(ResolverTest, ChannelOrder) {
  descriptor_.add_channels("conda-forge");
  descriptor_.add_channels("defaults");
  EXPECT_EQ(resolver_->Resolve(Dep("numpy", ""), descriptor_).version(),
            "1.18.1");
  EXPECT_EQ(resolver_->Resolve(Dep("numpy", "<1.18"), descriptor_).version(),
            "1.17.0");
}

// NOLINTNEXTLINE
TEST_F(ResolverTest, ExplicitChannel) {
  auto resolved =
      resolver_->Resolve(Dep("pytorch", "", "pytorch"), descriptor_);
  EXPECT_EQ(resolved.version(), "1.2.0");
  EXPECT_THROW(resolver_->Resolve(Dep("numpy", "", "pytorch"), descriptor_),
               builder::unresolvable_dependency);
}

// NOLINTNEXTLINE
TEST_F(ResolverTest, FallsBackToAnyChannel) {
  EXPECT_EQ(resolver_->Resolve(Dep("pytorch", "=1.1"), descriptor_).version(),
            "1.1.0");
}

// NOLINTNEXTLINE
TEST_F(ResolverTest, PipPackagesUseCanonicalNames) {
  auto resolved =
      resolver_->Resolve(Dep("torch-vision", "<0.4", "pypi"), descriptor_);
  EXPECT_EQ(resolved.version(), "0.3.0");
  EXPECT_EQ(resolved.channel(), "pypi");
  // Conda lookups never see pip packages.
  EXPECT_THROW(resolver_->Resolve(Dep("numpy", ">1.18.5"), descriptor_),
               builder::unresolvable_dependency);
}

// NOLINTNEXTLINE
TEST_F(ResolverTest, ExactPinMustExist) {
  EXPECT_EQ(resolver_->Resolve(Dep("numpy", "==1.16.4"), descriptor_).version(),
            "1.16.4");
  try {
    resolver_->Resolve(Dep("numpy", "==1.16.5"), descriptor_);
    FAIL() << "resolution should fail";
  } catch (const builder::unresolvable_dependency& exc) {
    EXPECT_EQ(exc.Name(), "numpy");
    EXPECT_EQ(exc.Kind(), proto::UNRESOLVABLE_DEPENDENCY);
  }
}

// NOLINTNEXTLINE
TEST_F(ResolverTest, UnknownPackage) {
  EXPECT_THROW(resolver_->Resolve(Dep("tensorflow", ""), descriptor_),
               builder::unresolvable_dependency);
}

// NOLINTNEXTLINE
TEST_F(ResolverTest, ResolveAllKeepsOrder) {
  *descriptor_.add_dependency() = Dep("pytorch", "");
  *descriptor_.add_dependency() = Dep("numpy", "=1.15");
  proto::ResolvedEnvironment env = resolver_->ResolveAll(descriptor_, "base");
  EXPECT_EQ(env.base_image(), "base");
  ASSERT_EQ(env.dependency_size(), 2);
  EXPECT_EQ(env.dependency(0).name(), "pytorch");
  EXPECT_EQ(env.dependency(1).version(), "1.15.4");
}

// NOLINTNEXTLINE
TEST(PinResolver, OnlyExactPins) {
  builder::PinResolver resolver;
  proto::RuntimeDescriptor descriptor;
  descriptor.add_channels("conda-forge");
  auto resolved = resolver.Resolve(Dep("numpy", "==1.16.4"), descriptor);
  EXPECT_EQ(resolved.version(), "1.16.4");
  EXPECT_EQ(resolved.channel(), "conda-forge");
  EXPECT_THROW(resolver.Resolve(Dep("numpy", ">=1"), descriptor),
               builder::unresolvable_dependency);
}

}  // namespace
