#ifndef BUILDER_LAYER_CACHE_HPP
#define BUILDER_LAYER_CACHE_HPP

#include <string>
#include <unordered_map>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/image.pb.h"
#include "proto/submission.pb.h"

namespace builder {

// File-backed cache of resolved dependency sets, shared by every pipeline.
// Lookups may run concurrently; insertions are serialized, and the last
// writer for a key wins.
class LayerCache {
 public:
  // Content hash identifying the resolution of descriptor on base_image.
  static std::string Key(const std::string& base_image,
                         const proto::RuntimeDescriptor& descriptor);

  bool Get(const std::string& key,
           proto::ResolvedEnvironment* environment) const;
  void Put(const std::string& key,
           const proto::ResolvedEnvironment& environment);
  size_t Size() const;

  // Loads the entries saved by a previous TearDown.
  void Setup();
  // Saves the entries to the store.
  void TearDown();

  explicit LayerCache(std::string store_directory)
      : store_directory_(std::move(store_directory)) {}
  ~LayerCache() = default;
  LayerCache(const LayerCache&) = delete;
  LayerCache(LayerCache&&) = delete;
  LayerCache& operator=(const LayerCache&) = delete;
  LayerCache& operator=(LayerCache&&) = delete;

 private:
  static const constexpr char* kCacheFile = "layer_cache";

  mutable absl::Mutex mutex_;
  std::unordered_map<std::string, proto::ResolvedEnvironment> cache_
      ABSL_GUARDED_BY(mutex_);
  std::string store_directory_;
};

}  // namespace builder

#endif
