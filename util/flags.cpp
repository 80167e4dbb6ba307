#include "util/flags.hpp"

DEFINE_string(store_directory, "files",
              "Where images, the layer cache and outputs should be stored");
DEFINE_string(temp_directory, "temp",
              "Where build contexts and execution contexts should be created");
DEFINE_bool(keep_images, false,
            "Do not remove images after their result has been reported");

DEFINE_int32(max_parallel, 0,
             "Number of submissions to evaluate concurrently. If unset, "
             "autodetect");
DEFINE_string(runtime, "",
              "Container runtime to use (local, docker). If unset, pick the "
              "best available one");
DEFINE_string(gpus, "",
              "Comma-separated GPU device ids available to the harness, or "
              "\"auto\" to detect them");

DEFINE_string(cpu_base_image, "continuumio/miniconda3:4.7.12",
              "Base image for submissions that do not require a GPU");
DEFINE_string(gpu_base_image, "aicrowd/base-images:cuda10.0-cudnn7-conda",
              "Base image for submissions that require a GPU");
DEFINE_string(package_index, "",
              "Package index snapshot used to pin dependencies (text proto)");
DEFINE_string(challenges, "",
              "Registry of known challenges and graders (text proto)");
DEFINE_string(submission_dir, ".", "Submission directory to build");
DEFINE_double(build_time_limit, 7200,
              "Wall-clock limit for building an image, in seconds (0 for no "
              "limit)");

DEFINE_double(time_limit, 3600, "Wall-clock limit for a run, in seconds");
DEFINE_int64(memory_limit, 0, "Memory limit for a run, in KiB");
DEFINE_int32(max_output_kb, 1024,
             "Amount of stdout/stderr to keep for each run, in KiB");
DEFINE_string(forward_env, "AICROWD_DATASET_NAME,DISENTANGLEMENT_LIB_DATA",
              "Comma-separated environment variables to forward to the "
              "entrypoint");
DEFINE_bool(gpu, false, "Forward a GPU device to the run command");
