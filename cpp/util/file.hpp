#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <sys/types.h>

#include <cstdint>
#include <string>

#include <kj/common.h>

namespace util {

class File {
 public:
  // Reads the whole file specified by path. At most limit bytes are read.
  static std::string Read(const std::string& path,
                          uint64_t limit = UINT64_MAX);

  // Reads the last limit bytes of the file, or all of it if it is smaller.
  static std::string ReadTail(const std::string& path, uint64_t limit);

  // Writes content to the file specified by path. The file is written to a
  // temporary file first and then moved in place.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = false);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Changes the permission bits of a file.
  static void SetMode(const std::string& path, mode_t mode);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction, unless Remove or Keep were called.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  // Removes the folder now. Returns false and sets error_msg on failure; the
  // destructor will not try again.
  bool Remove(std::string* error_msg);

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    removed_ = other.removed_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
  bool removed_ = false;
};

}  // namespace util

#endif
