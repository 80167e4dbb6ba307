#include "util/file.hpp"
#include "util/sha256.hpp"

#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <fstream>
#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

// mkdtemp and mkostemp modify their argument in place.
std::vector<char> Template(const std::string& pattern) {
  std::vector<char> data(pattern.begin(), pattern.end());
  data.push_back('\0');
  return data;
}

std::string OsTempDir(const std::string& path) {
  std::vector<char> data = Template(util::File::JoinPath(path, "XXXXXX"));
  if (mkdtemp(data.data()) == nullptr) {
    return "";
  }
  return data.data();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  std::vector<char> data = Template(path + ".XXXXXX");
  int fd = mkostemp(data.data(), O_CLOEXEC);
  *tmp = data.data();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    if (!exist_ok || errno != EEXIST) return errno;
    remove(src.c_str());
    return 0;
  }
  return remove(src.c_str()) != -1 ? 0 : errno;
}

int OsRead(const std::string& path,
           const util::File::ChunkReceiver& chunk_receiver) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  std::unique_ptr<char[]> buf{new char[util::kChunkSize]};
  ssize_t amount;
  try {
    while ((amount = read(fd, buf.get(), util::kChunkSize))) {
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      chunk_receiver(std::string(buf.get(), amount));
    }
  } catch (...) {
    close(fd);
    throw;
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path,
            const util::File::ChunkProducer& chunk_producer, bool overwrite,
            bool exist_ok) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  try {
    chunk_producer([&fd, &temp_file](const std::string& chunk) {
      size_t pos = 0;
      while (pos < chunk.size()) {
        ssize_t written = write(fd, chunk.c_str() + pos, chunk.size() - pos);
        if (written == -1 && errno == EINTR) continue;
        if (written == -1) {
          throw std::system_error(errno, std::system_category(),
                                  "write " + temp_file);
        }
        pos += written;
      }
    });
  } catch (...) {
    close(fd);
    remove(temp_file.c_str());
    throw;
  }
  if (close(fd) == -1) return errno;
  return OsAtomicMove(temp_file, path, overwrite, exist_ok);
}

thread_local int share_uid = -1;
thread_local int share_gid = -1;

void OsListFiles(const std::string& root, const std::string& relative,
                 const std::vector<std::string>& skip,
                 std::vector<std::string>* out) {
  std::string dir = relative.empty() ? root : root + "/" + relative;
  DIR* handle = opendir(dir.c_str());
  if (handle == nullptr) {
    if (errno == ENOENT) return;
    throw std::system_error(errno, std::system_category(), "opendir " + dir);
  }
  std::vector<std::string> subdirs;
  while (struct dirent* entry = readdir(handle)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    std::string rel = relative.empty() ? name : relative + "/" + name;
    struct stat st {};
    if (lstat((root + "/" + rel).c_str(), &st) == -1) continue;
    if (S_ISDIR(st.st_mode)) {
      if (std::find(skip.begin(), skip.end(), name) == skip.end())
        subdirs.push_back(rel);
    } else if (S_ISREG(st.st_mode)) {
      out->push_back(rel);
    }
  }
  closedir(handle);
  for (const std::string& sub : subdirs) OsListFiles(root, sub, skip, out);
}

}  // namespace
#endif

namespace util {

void File::Read(const std::string& path,
                const File::ChunkReceiver& chunk_receiver) {
  int err = OsRead(path, chunk_receiver);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
}

std::string File::ReadAll(const std::string& path) {
  std::string contents;
  Read(path, [&contents](const std::string& chunk) { contents += chunk; });
  return contents;
}

std::string File::ReadTail(const std::string& path, int64_t max_bytes,
                           bool* truncated) {
  std::ifstream fin(path, std::ios::binary | std::ios::ate);
  if (!fin) throw file_not_found("ReadTail " + path);
  int64_t size = fin.tellg();
  int64_t start = 0;
  *truncated = false;
  if (max_bytes >= 0 && size > max_bytes) {
    start = size - max_bytes;
    *truncated = true;
  }
  fin.seekg(start);
  std::string contents(size - start, '\0');
  fin.read(&contents[0], contents.size());
  contents.resize(fin.gcount());
  return contents;
}

void File::Write(const std::string& path, const ChunkProducer& chunk_producer,
                 bool overwrite, bool exist_ok) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return;
    throw file_exists("Write " + path);
  }
  int err = OsWrite(path, chunk_producer, overwrite, exist_ok);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::Write(const std::string& path, const std::string& contents,
                 bool overwrite, bool exist_ok) {
  Write(path,
        [&contents](const ChunkReceiver& receiver) { receiver(contents); },
        overwrite, exist_ok);
}

SHA256_t File::Hash(const std::string& path) {
  SHA256 hasher;
  Read(path, [&hasher](const std::string& chunk) {
    hasher.update(reinterpret_cast<const unsigned char*>(chunk.c_str()),
                  chunk.size());
  });
  SHA256_t digest;
  hasher.finalize(&digest);
  return digest;
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

std::vector<std::string> File::ListFiles(const std::string& path,
                                         const std::vector<std::string>& skip) {
  std::vector<std::string> files;
  OsListFiles(path, "", skip, &files);
  std::sort(files.begin(), files.end());
  return files;
}

void File::DeepCopy(const std::string& from, const std::string& to,
                    bool overwrite, bool exist_ok) {
  using namespace std::placeholders;
  Write(to, std::bind(Read, from, _1), overwrite, exist_ok);
  struct stat st {};
  if (stat(from.c_str(), &st) == -1 ||
      chmod(to.c_str(), st.st_mode & 07777) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod " + to);
  }
}

void File::CopyTree(const std::string& from, const std::string& to,
                    const std::vector<std::string>& skip) {
  MakeDirs(to);
  for (const std::string& file : ListFiles(from, skip)) {
    DeepCopy(JoinPath(from, file), JoinPath(to, file), /*overwrite=*/true);
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

void File::MakeExecutable(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1 ||
      chmod(path.c_str(), st.st_mode | S_IXUSR | S_IXGRP | S_IXOTH) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }
}

void File::ShareTree(const std::string& path, int uid, int gid) {
  share_uid = uid;
  share_gid = gid;
  int ret = nftw(
      path.c_str(),
      [](const char* fpath, const struct stat* sb, int typeflag,
         struct FTW* /*ftwbuf*/) {
        mode_t mode = sb->st_mode & 07777;
        mode |= S_IRUSR | S_IRGRP | S_IROTH;
        if (typeflag == FTW_D || (mode & S_IXUSR)) {
          mode |= S_IXUSR | S_IXGRP | S_IXOTH;
        }
        if (chmod(fpath, mode) == -1) return -1;
        if (share_uid >= 0 && chown(fpath, share_uid, share_gid) == -1)
          return -1;
        return 0;
      },
      64, FTW_PHYS | FTW_MOUNT);
  if (ret == -1)
    throw std::system_error(errno, std::system_category(), "share " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::Rooted(const std::string& root, const std::string& path) {
  size_t start = path.find_first_not_of(kPathSeparators);
  if (start == std::string::npos) return root;
  return JoinPath(root, path.substr(start));
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  std::ifstream fin(path, std::ios::ate | std::ios::binary);
  if (!fin) return -1;
  return fin.tellg();
}

bool File::Exists(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) != -1;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (moved_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
