#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/types.h>

// std::system_error carrying errno and the path it happened on.
std::system_error io_error(int err, const std::string& action, const std::filesystem::path& path);

// Owns one POSIX descriptor. All failures throw std::system_error.
class FileHandle {
public:
  FileHandle() = default;
  ~FileHandle();

  FileHandle(FileHandle&& other) noexcept;
  FileHandle& operator=(FileHandle&& other) noexcept;
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  static FileHandle open(const std::filesystem::path& path, int flags, mode_t mode = 0644);

  // Short reads past EOF are errors: the caller asked for exactly `length`.
  void read_exact_at(void* buffer, std::size_t length, std::uint64_t offset) const;
  void write_all_at(const void* buffer, std::size_t length, std::uint64_t offset) const;

  // Returns 0 at end of file.
  std::size_t read_some(void* buffer, std::size_t length) const;
  void write_all(const void* buffer, std::size_t length) const;

  // Reports the error close(2) returns, unlike the destructor.
  void close();

private:
  FileHandle(int fd, std::filesystem::path path);

  int fd_ = -1;
  std::filesystem::path path_;
};
