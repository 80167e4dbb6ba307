#ifndef HARNESS_GPU_POOL_HPP
#define HARNESS_GPU_POOL_HPP
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"

namespace harness {

// Set of GPU devices shared by every execution. Devices are handed out
// without blocking: a caller that finds the pool empty gets nothing.
class GpuPool {
 public:
  // Exclusive use of one device, returned to the pool on destruction. The
  // pool must outlive its leases.
  class Lease {
   public:
    int32_t Device() const { return device_; }

    Lease(Lease&& other) noexcept : pool_(other.pool_), device_(other.device_) {
      other.pool_ = nullptr;
    }
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    ~Lease();

   private:
    friend class GpuPool;
    Lease(GpuPool* pool, int32_t device) : pool_(pool), device_(device) {}

    GpuPool* pool_;
    int32_t device_;
  };

  explicit GpuPool(std::vector<int32_t> devices);

  // Builds a pool from a comma-separated list of device ids, or from the
  // devices found on this machine if spec is "auto". Throws
  // std::invalid_argument on malformed lists.
  static std::shared_ptr<GpuPool> FromFlag(const std::string& spec);

  // Device ids of the NVIDIA devices of this machine.
  static std::vector<int32_t> Detect();

  absl::optional<Lease> TryAcquire();

  size_t Available() const;
  size_t Size() const { return size_; }

  ~GpuPool() = default;
  GpuPool(const GpuPool&) = delete;
  GpuPool& operator=(const GpuPool&) = delete;
  GpuPool(GpuPool&&) = delete;
  GpuPool& operator=(GpuPool&&) = delete;

 private:
  void Release(int32_t device);

  mutable absl::Mutex mutex_;
  std::vector<int32_t> free_ ABSL_GUARDED_BY(mutex_);
  size_t size_;
};

}  // namespace harness

#endif
