#include "file_handle.hpp"

#include <cerrno>
#include <utility>

#include <unistd.h>

std::system_error io_error(int err, const std::string& action, const std::filesystem::path& path) {
  return std::system_error(err, std::generic_category(), action + " '" + path.string() + "'");
}

FileHandle::FileHandle(int fd, std::filesystem::path path)
  : fd_(fd), path_(std::move(path)) {}

FileHandle::~FileHandle() {
  if(fd_ >= 0) ::close(fd_);
}

FileHandle::FileHandle(FileHandle&& other) noexcept
  : fd_(std::exchange(other.fd_, -1)),
    path_(std::move(other.path_)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
  if(this != &other) {
    if(fd_ >= 0) ::close(fd_);
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

FileHandle FileHandle::open(const std::filesystem::path& path, int flags, mode_t mode) {
  int fd = -1;
  do {
    fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
  } while(fd < 0 && errno == EINTR);
  if(fd < 0) {
    throw io_error(errno, "cannot open", path);
  }
  return FileHandle(fd, path);
}

void FileHandle::read_exact_at(void* buffer, std::size_t length, std::uint64_t offset) const {
  auto* out = static_cast<char*>(buffer);
  while(length > 0) {
    auto got = ::pread(fd_, out, length, static_cast<off_t>(offset));
    if(got < 0) {
      if(errno == EINTR) continue;
      throw io_error(errno, "read failed on", path_);
    }
    if(got == 0) {
      throw io_error(EIO, "unexpected end of file in", path_);
    }
    out += got;
    offset += static_cast<std::uint64_t>(got);
    length -= static_cast<std::size_t>(got);
  }
}

void FileHandle::write_all_at(const void* buffer, std::size_t length, std::uint64_t offset) const {
  const auto* in = static_cast<const char*>(buffer);
  while(length > 0) {
    auto put = ::pwrite(fd_, in, length, static_cast<off_t>(offset));
    if(put < 0) {
      if(errno == EINTR) continue;
      throw io_error(errno, "write failed on", path_);
    }
    in += put;
    offset += static_cast<std::uint64_t>(put);
    length -= static_cast<std::size_t>(put);
  }
}

std::size_t FileHandle::read_some(void* buffer, std::size_t length) const {
  for(;;) {
    auto got = ::read(fd_, buffer, length);
    if(got >= 0) return static_cast<std::size_t>(got);
    if(errno != EINTR) {
      throw io_error(errno, "read failed on", path_);
    }
  }
}

void FileHandle::write_all(const void* buffer, std::size_t length) const {
  const auto* in = static_cast<const char*>(buffer);
  while(length > 0) {
    auto put = ::write(fd_, in, length);
    if(put < 0) {
      if(errno == EINTR) continue;
      throw io_error(errno, "write failed on", path_);
    }
    in += put;
    length -= static_cast<std::size_t>(put);
  }
}

void FileHandle::close() {
  if(fd_ < 0) return;
  int fd = std::exchange(fd_, -1);
  if(::close(fd) != 0 && errno != EINTR) {
    throw io_error(errno, "close failed on", path_);
  }
}
