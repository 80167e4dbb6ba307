#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Storage
DECLARE_string(store_directory);
DECLARE_string(temp_directory);
DECLARE_bool(keep_images);

// Scheduling
DECLARE_int32(max_parallel);
DECLARE_string(runtime);
DECLARE_string(gpus);

// Build
DECLARE_string(cpu_base_image);
DECLARE_string(gpu_base_image);
DECLARE_string(package_index);
DECLARE_string(challenges);
DECLARE_string(submission_dir);
DECLARE_double(build_time_limit);

// Execution
DECLARE_double(time_limit);
DECLARE_int64(memory_limit);
DECLARE_int32(max_output_kb);
DECLARE_string(forward_env);
DECLARE_bool(gpu);

#endif
