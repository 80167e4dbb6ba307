#ifndef REPORTER_REPORTER_HPP
#define REPORTER_REPORTER_HPP
#include <string>

#include "proto/execution.pb.h"

namespace reporter {

// Turns an execution result into the outcome shown to participants. Output
// references are the SHA-256 of the captured streams, empty for empty
// streams.
proto::StructuredOutcome Report(const proto::ExecutionResult& result) noexcept;

// Saves the captured streams of result in the content-addressed store, where
// the references of its outcome point.
void PersistOutputs(const proto::ExecutionResult& result,
                    const std::string& store_directory);

// Path of a stored stream.
std::string OutputPath(const std::string& store_directory,
                       const std::string& ref);

// Single-line JSON rendering of outcome, with every field present.
std::string ToJson(const proto::StructuredOutcome& outcome);

// Process exit code of the CLI for a status.
int ExitCodeFor(proto::Status status) noexcept;

}  // namespace reporter

#endif
