#include <iostream>
#include <string>
#include <vector>

#include "cli/commands.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "reporter/reporter.hpp"
#include "util/flags.hpp"

namespace {
const char* const kUsage =
    "Builds and runs AIcrowd submissions.\n"
    "  aicrowd-harness build [--submission_dir=DIR]\n"
    "  aicrowd-harness run [--gpu]\n"
    "  aicrowd-harness evaluate DIR...";

// Exit code for command line errors.
static const constexpr int kUsageError = 64;
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  if (argc < 2) {
    std::cerr << kUsage << std::endl;
    return kUsageError;
  }
  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);
  try {
    if (command == "build" && args.empty()) {
      return cli::Build(FLAGS_submission_dir);
    }
    if (command == "run" && args.empty()) {
      return cli::Run(FLAGS_gpu);
    }
    if (command == "evaluate" && !args.empty()) {
      return cli::Evaluate(args);
    }
  } catch (const std::exception& exc) {
    LOG(ERROR) << command << " failed: " << exc.what();
    return reporter::ExitCodeFor(proto::INTERNAL_ERROR);
  }
  std::cerr << kUsage << std::endl;
  return kUsageError;
}
