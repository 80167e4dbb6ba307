#ifndef MANIFEST_RUNTIME_PARSER_HPP
#define MANIFEST_RUNTIME_PARSER_HPP
#include <string>

#include "proto/submission.pb.h"

namespace manifest {

// Channel assigned to requirements listed in the pip section.
static const constexpr char* kPipChannel = "pypi";

// Parses the contents of a conda environment file (environment.yml) into a
// descriptor. Blank contents give an empty descriptor. Throws
// malformed_runtime if the contents are not an environment file, or if two
// entries name the same package with different constraints.
proto::RuntimeDescriptor ParseRuntime(const std::string& contents);

// Parses a conda match spec such as "conda-forge::numpy=1.16.4=py37_0".
proto::Dependency ParseCondaRequirement(const std::string& spec);

// Parses a pip requirement such as "Torch[cuda]>=1.1,<2; python_version>'3'".
proto::Dependency ParsePipRequirement(const std::string& spec);

// Name under which packages are compared: lowercase, and for pip packages
// with '_' and '.' folded to '-'.
std::string CanonicalName(const std::string& name, bool pip);

}  // namespace manifest

#endif
