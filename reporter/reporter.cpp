#include "reporter/reporter.hpp"

#include <stdexcept>

#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"
#include "util/sha256.hpp"

namespace {
static const constexpr char* kOutputsDir = "outputs";

std::string Ref(const std::string& stream) {
  if (stream.empty()) return "";
  return util::HashString(stream).Hex();
}

std::string Detail(const std::string& message) {
  return message.empty() ? "" : ": " + message;
}

std::string Message(const proto::ExecutionResult& result) {
  switch (result.status()) {
    case proto::SUCCESS:
      return "Submission ran successfully";
    case proto::RUNTIME_FAILURE:
      if (result.signal() != 0) {
        return "Entrypoint killed by signal " +
               std::to_string(result.signal());
      }
      return "Entrypoint exited with code " +
             std::to_string(result.exit_code());
    case proto::TIMEOUT:
      return "Wall-clock limit exceeded";
    case proto::BUILD_FAILURE:
      return "Image build failed" + Detail(result.error_message());
    case proto::RESOURCE_UNAVAILABLE:
      return "No GPU device available";
    case proto::VALIDATION_FAILURE:
      return "Invalid submission" + Detail(result.error_message());
    case proto::CANCELLED:
      return "Evaluation cancelled";
    case proto::INTERNAL_ERROR:
    default:
      return "Internal error" + Detail(result.error_message());
  }
}
}  // namespace

namespace reporter {

proto::StructuredOutcome Report(const proto::ExecutionResult& result) noexcept {
  proto::StructuredOutcome outcome;
  outcome.set_submission_id(result.submission_id());
  outcome.set_status(result.status());
  outcome.set_message(Message(result));
  outcome.set_stdout_ref(Ref(result.stdout_tail()));
  outcome.set_stderr_ref(Ref(result.stderr_tail()));
  outcome.set_output_truncated(result.stdout_truncated() ||
                               result.stderr_truncated());
  outcome.set_duration(result.wall_time());
  outcome.set_exit_code(result.exit_code());
  outcome.set_retryable(result.status() == proto::TIMEOUT ||
                        result.status() == proto::RESOURCE_UNAVAILABLE);
  return outcome;
}

std::string OutputPath(const std::string& store_directory,
                       const std::string& ref) {
  if (ref.size() < 4) throw std::invalid_argument("Invalid reference " + ref);
  return util::File::JoinPath(
      util::File::JoinPath(store_directory, kOutputsDir),
      util::File::JoinPath(
          util::File::JoinPath(ref.substr(0, 2), ref.substr(2, 2)), ref));
}

void PersistOutputs(const proto::ExecutionResult& result,
                    const std::string& store_directory) {
  for (const std::string* stream :
       {&result.stdout_tail(), &result.stderr_tail()}) {
    if (stream->empty()) continue;
    std::string path = OutputPath(store_directory, Ref(*stream));
    // Identical contents are stored once.
    util::File::Write(path, *stream);
    VLOG(1) << "Stored output of " << result.submission_id() << " in " << path;
  }
}

std::string ToJson(const proto::StructuredOutcome& outcome) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(outcome, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Cannot render outcome: " + status.ToString());
  }
  return json;
}

int ExitCodeFor(proto::Status status) noexcept {
  switch (status) {
    case proto::SUCCESS:
      return 0;
    case proto::RUNTIME_FAILURE:
      return 1;
    case proto::TIMEOUT:
      return 2;
    case proto::BUILD_FAILURE:
      return 3;
    case proto::RESOURCE_UNAVAILABLE:
      return 4;
    case proto::VALIDATION_FAILURE:
      return 5;
    case proto::CANCELLED:
      return 6;
    case proto::INTERNAL_ERROR:
    default:
      return 7;
  }
}

}  // namespace reporter
