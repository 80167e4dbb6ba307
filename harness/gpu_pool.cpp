#include "harness/gpu_pool.hpp"

#include <algorithm>
#include <stdexcept>

#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
static const constexpr int32_t kMaxDevices = 64;
}  // namespace

namespace harness {

GpuPool::Lease& GpuPool::Lease::operator=(Lease&& other) noexcept {
  if (pool_ != nullptr) pool_->Release(device_);
  pool_ = other.pool_;
  device_ = other.device_;
  other.pool_ = nullptr;
  return *this;
}

GpuPool::Lease::~Lease() {
  if (pool_ != nullptr) pool_->Release(device_);
}

GpuPool::GpuPool(std::vector<int32_t> devices) : size_(devices.size()) {
  // Lowest ids are handed out first.
  std::sort(devices.rbegin(), devices.rend());
  absl::MutexLock lck(&mutex_);
  free_ = std::move(devices);
}

std::shared_ptr<GpuPool> GpuPool::FromFlag(const std::string& spec) {
  std::vector<int32_t> devices;
  if (spec == "auto") {
    devices = Detect();
  } else {
    for (const std::string& item : util::split(spec, ',')) {
      int32_t device = 0;
      if (!absl::SimpleAtoi(util::Trim(item), &device) || device < 0) {
        throw std::invalid_argument("Invalid GPU device id: " + item);
      }
      if (std::find(devices.begin(), devices.end(), device) != devices.end()) {
        throw std::invalid_argument("Duplicate GPU device id: " + item);
      }
      devices.push_back(device);
    }
  }
  LOG(INFO) << "GPU devices: [" << absl::StrJoin(devices, ",") << "]";
  return std::make_shared<GpuPool>(std::move(devices));
}

std::vector<int32_t> GpuPool::Detect() {
  std::vector<int32_t> devices;
  for (int32_t i = 0; i < kMaxDevices; i++) {
    if (util::File::Exists("/dev/nvidia" + std::to_string(i)))
      devices.push_back(i);
  }
  return devices;
}

absl::optional<GpuPool::Lease> GpuPool::TryAcquire() {
  absl::MutexLock lck(&mutex_);
  if (free_.empty()) return absl::nullopt;
  int32_t device = free_.back();
  free_.pop_back();
  VLOG(1) << "Leased GPU " << device;
  return Lease(this, device);
}

void GpuPool::Release(int32_t device) {
  absl::MutexLock lck(&mutex_);
  free_.push_back(device);
  std::sort(free_.rbegin(), free_.rend());
  VLOG(1) << "Released GPU " << device;
}

size_t GpuPool::Available() const {
  absl::MutexLock lck(&mutex_);
  return free_.size();
}

}  // namespace harness
