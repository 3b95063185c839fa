#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/io.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kReadChunk = 64 * 1024;

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

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  char data[max_path_len];
  data[0] = 0;
  strncat(data, tmp->c_str(), max_path_len - 1);  // NOLINT
  int fd = mkostemp(data, O_CLOEXEC);             // NOLINT
  *tmp = data;                                    // NOLINT
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

// Reads at most limit bytes from the current position of fd.
std::string ReadFd(int fd, uint64_t limit, const std::string& path) {
  std::string content;
  char buf[kReadChunk];
  while (content.size() < limit) {
    size_t to_read = kReadChunk;
    if (limit - content.size() < to_read) to_read = limit - content.size();
    ssize_t amount = read(fd, buf, to_read);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) break;
    content.append(buf, amount);  // NOLINT
  }
  return content;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path, uint64_t limit) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  return ReadFd(fd, limit, path);
}

std::string File::ReadTail(const std::string& path, uint64_t limit) {
  int64_t size = Size(path);
  if (size < 0) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  if (static_cast<uint64_t>(size) <= limit) return Read(path, limit);
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  off_t offset = static_cast<off_t>(size - static_cast<int64_t>(limit));
  if (fd.get() == -1 || lseek(fd, offset, SEEK_SET) == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  return ReadFd(fd, limit, path);
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  if (!BaseDir(path).empty()) MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  std::string temp_file;
  kj::AutoCloseFd fd = OsTempFile(path, &temp_file);
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos,  // NOLINT
                            content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int err = errno;
      OsRemove(temp_file);
      throw std::system_error(err, std::system_category(),
                              "write " + temp_file);
    }
    pos += written;
  }
  if (fsync(fd) == -1) {
    int err = errno;
    OsRemove(temp_file);
    throw std::system_error(err, std::system_category(), "fsync " + temp_file);
  }
  // mkostemp creates the file with mode 0600.
  if (fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1) {
    int err = errno;
    OsRemove(temp_file);
    throw std::system_error(err, std::system_category(), "chmod " + temp_file);
  }
  if (int err = OsAtomicMove(temp_file, path, overwrite)) {
    OsRemove(temp_file);
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

void File::SetMode(const std::string& path, mode_t mode) {
  if (chmod(path.c_str(), mode) == -1) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }

bool TempDir::Remove(std::string* error_msg) {
  removed_ = true;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
  return true;
}

TempDir::~TempDir() {  // NOLINT
  if (keep_ || moved_ || removed_) return;
  std::string error_msg;
  if (!Remove(&error_msg)) {
    KJ_LOG(WARNING, "Cannot remove temporary directory", path_, error_msg);
  }
}

}  // namespace util
