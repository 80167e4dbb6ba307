#include "builder/layer_cache.hpp"

#include <fstream>

#include "glog/logging.h"
#include "util/file.hpp"
#include "util/sha256.hpp"

namespace builder {

std::string LayerCache::Key(const std::string& base_image,
                            const proto::RuntimeDescriptor& descriptor) {
  // Fields are length-prefixed so that no two descriptors share a key.
  util::SHA256 hasher;
  auto add = [&hasher](const std::string& field) {
    hasher.update(std::to_string(field.size()) + ":");
    hasher.update(field);
  };
  add(base_image);
  for (const std::string& channel : descriptor.channels()) add(channel);
  hasher.update("|");
  for (const proto::Dependency& dependency : descriptor.dependency()) {
    add(dependency.name());
    add(dependency.constraint());
    add(dependency.channel());
  }
  util::SHA256_t digest;
  hasher.finalize(&digest);
  return digest.Hex();
}

bool LayerCache::Get(const std::string& key,
                     proto::ResolvedEnvironment* environment) const {
  absl::ReaderMutexLock lck(&mutex_);
  auto it = cache_.find(key);
  if (it == cache_.end()) return false;
  *environment = it->second;
  return true;
}

void LayerCache::Put(const std::string& key,
                     const proto::ResolvedEnvironment& environment) {
  absl::WriterMutexLock lck(&mutex_);
  cache_[key] = environment;
}

size_t LayerCache::Size() const {
  absl::ReaderMutexLock lck(&mutex_);
  return cache_.size();
}

void LayerCache::Setup() {
  util::File::MakeDirs(store_directory_);
  std::string path = util::File::JoinPath(store_directory_, kCacheFile);
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return;
  proto::LayerCacheData data;
  if (!data.ParseFromIstream(&fin)) {
    LOG(WARNING) << "Ignoring corrupted layer cache " << path;
    return;
  }
  absl::WriterMutexLock lck(&mutex_);
  for (const proto::LayerCacheEntry& entry : data.entry()) {
    cache_[entry.key()] = entry.environment();
  }
  VLOG(1) << "Loaded " << cache_.size() << " cached layers";
}

void LayerCache::TearDown() {
  proto::LayerCacheData data;
  {
    absl::ReaderMutexLock lck(&mutex_);
    for (const auto& entry : cache_) {
      proto::LayerCacheEntry* out = data.add_entry();
      out->set_key(entry.first);
      *out->mutable_environment() = entry.second;
    }
  }
  util::File::Write(util::File::JoinPath(store_directory_, kCacheFile),
                    data.SerializeAsString(), /*overwrite=*/true);
}

}  // namespace builder
