#ifndef BUILDER_VERSION_HPP
#define BUILDER_VERSION_HPP
#include <string>

namespace builder {

// Compares two version strings. Numeric components compare as numbers,
// alphabetic ones as strings, and a pre-release tag ("1.0rc1") sorts before
// the release. Trailing zero components are ignored. Returns a negative
// number, zero or a positive number.
int CompareVersions(const std::string& first, const std::string& second);

// Returns true if version satisfies every item of a normalized constraint,
// such as ">=1.16,<2" or "=3.7" (prefix match). An empty constraint accepts
// any version.
bool Satisfies(const std::string& version, const std::string& constraint);

// Returns the version pinned by a constraint of the form "==v", or an empty
// string.
std::string ExactPin(const std::string& constraint);

}  // namespace builder

#endif
