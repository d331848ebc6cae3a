#include "utils.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <climits>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::runtime_error openssl_failure(const char* what) {
  char buffer[256] = {0};
  ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
  return std::runtime_error(std::string(what) + ": " + buffer);
}

} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& b){
  std::ostringstream oss;
  for(auto c : b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
  return oss.str();
}

std::string sha256_file_hex(const std::filesystem::path& path){
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            "cannot open " + path.string());
  }
  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw openssl_failure("EVP_DigestInit_ex");
  }
  std::vector<char> buffer(1 << 20);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      throw openssl_failure("EVP_DigestUpdate");
    }
  }
  if(in.bad()) {
    throw std::system_error(std::make_error_code(std::errc::io_error),
                            "read failed on " + path.string());
  }
  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    throw openssl_failure("EVP_DigestFinal_ex");
  }
  digest.resize(length);
  return hex_from_bytes(digest);
}

void fill_random(unsigned char* out, std::size_t size){
  while(size > 0) {
    const int step = static_cast<int>(std::min<std::size_t>(size, INT_MAX));
    if(RAND_bytes(out, step) != 1) {
      throw openssl_failure("RAND_bytes");
    }
    out += step;
    size -= static_cast<std::size_t>(step);
  }
}

std::string format_size(double bytes){
  static constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};
  for(const char* unit : kUnits) {
    if(bytes < 1024.0) return fmt::format("{:.1f}{}", bytes, unit);
    bytes /= 1024.0;
  }
  return fmt::format("{:.1f}PB", bytes);
}

std::string format_speed(double bytes_per_second){
  constexpr double kKiB = 1024.0;
  constexpr double kMiB = kKiB * 1024.0;
  constexpr double kGiB = kMiB * 1024.0;
  constexpr double kTiB = kGiB * 1024.0;
  if(bytes_per_second < kKiB) return fmt::format("{:.0f}B/s", bytes_per_second);
  if(bytes_per_second < kMiB) return fmt::format("{:.1f}KB/s", bytes_per_second / kKiB);
  if(bytes_per_second < kGiB) return fmt::format("{:.1f}MB/s", bytes_per_second / kMiB);
  if(bytes_per_second < kTiB) return fmt::format("{:.1f}GB/s", bytes_per_second / kGiB);
  return fmt::format("{:.1f}TB/s", bytes_per_second / kTiB);
}

std::string format_time(double seconds){
  if(seconds < 0) return "calculating...";
  if(seconds < 60) return fmt::format("{}s", static_cast<long long>(seconds));
  if(seconds < 3600) {
    auto mins = static_cast<long long>(seconds / 60);
    auto secs = static_cast<long long>(seconds) % 60;
    return fmt::format("{}m {}s", mins, secs);
  }
  auto hours = static_cast<long long>(seconds / 3600);
  auto mins = (static_cast<long long>(seconds) % 3600) / 60;
  return fmt::format("{}h {}m", hours, mins);
}

bool is_path_within(const std::filesystem::path& candidate, const std::filesystem::path& root){
  auto rel = candidate.lexically_relative(root);
  if(rel.empty()) return false;
  auto first = rel.begin();
  return first == rel.end() || *first != "..";
}

bool is_system_directory(const std::filesystem::path& path){
  static const char* const kSystemRoots[] = {
    "/bin", "/boot", "/etc", "/lib", "/lib64", "/sbin", "/sys", "/usr", "/proc", "/dev"
  };
  std::error_code ec;
  // weakly_canonical resolves the existing prefix, so a destination that
  // does not exist yet still resolves through symlinked parents.
  auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
  if(ec) return false;
  for(const char* root : kSystemRoots) {
    std::error_code root_ec;
    if(!std::filesystem::exists(root, root_ec)) continue;
    auto system_root = std::filesystem::canonical(root, root_ec);
    if(root_ec) continue;
    if(is_path_within(resolved, system_root)) return true;
  }
  return false;
}
