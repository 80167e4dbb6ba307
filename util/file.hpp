#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include "util/sha256.hpp"

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  using ChunkReceiver = std::function<void(const std::string&)>;
  using ChunkProducer = std::function<void(const ChunkReceiver&)>;

  // Reads the file specified by path in chunks.
  static void Read(const std::string& path,
                   const ChunkReceiver& chunk_receiver);

  // Reads the whole file specified by path.
  static std::string ReadAll(const std::string& path);

  // Reads at most max_bytes from the end of the file. Sets truncated if the
  // file was longer than that.
  static std::string ReadTail(const std::string& path, int64_t max_bytes,
                              bool* truncated);

  // Atomically writes the data produced by chunk_producer to path.
  static void Write(const std::string& path,
                    const ChunkProducer& chunk_producer,
                    bool overwrite = false, bool exist_ok = true);
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false, bool exist_ok = true);

  // Computes the hash of the file specified by path.
  static SHA256_t Hash(const std::string& path);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Lists the regular files below path, as paths relative to it, sorted.
  // Directories named in skip are not visited.
  static std::vector<std::string> ListFiles(
      const std::string& path, const std::vector<std::string>& skip = {});

  // Makes a full copy of the given file, keeping its permission bits.
  static void DeepCopy(const std::string& from, const std::string& to,
                       bool overwrite = false, bool exist_ok = true);

  // Deep-copies every file below from into to.
  static void CopyTree(const std::string& from, const std::string& to,
                       const std::vector<std::string>& skip = {});

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Adds execute permissions to a file.
  static void MakeExecutable(const std::string& path);

  // Sets the permissions of every entry below path so that any user can read
  // it and traverse it, and changes the owner if uid is not negative.
  static void ShareTree(const std::string& path, int uid = -1, int gid = -1);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Places an absolute path below root.
  static std::string Rooted(const std::string& root, const std::string& path);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file or directory exists.
  static bool Exists(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
