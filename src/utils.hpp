#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

inline constexpr std::size_t kDigestReadSize = 1024 * 1024;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string md5_hex(const std::string& data);
// Streams the file through MD5 in kDigestReadSize increments.
std::optional<std::string> md5_file_hex(const std::filesystem::path& file);
bool is_md5_hex(const std::string& value);

std::string format_size(uint64_t bytes);
std::string format_duration_compact(std::chrono::steady_clock::duration elapsed);
std::string trim_copy(std::string value);
std::string to_lower(std::string value);
