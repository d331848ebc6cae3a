#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_file_hex(const std::filesystem::path& path);

// Fills `out` with cryptographically random bytes; throws on RNG failure.
void fill_random(unsigned char* out, std::size_t size);

std::string format_size(double bytes);
std::string format_speed(double bytes_per_second);
std::string format_time(double seconds);

bool is_path_within(const std::filesystem::path& candidate, const std::filesystem::path& root);
bool is_system_directory(const std::filesystem::path& path);
