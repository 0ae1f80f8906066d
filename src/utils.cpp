#include "utils.hpp"

#include <openssl/evp.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>

namespace {

struct MdContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

MdContext new_md5_context() {
  MdContext ctx(EVP_MD_CTX_new());
  if(!ctx) return nullptr;
  if(EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) return nullptr;
  return ctx;
}

std::optional<std::string> finish_hex(EVP_MD_CTX* ctx) {
  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) return std::nullopt;
  digest.resize(length);
  return hex_from_bytes(digest);
}

} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& bytes) {
  static const char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for(unsigned char byte : bytes) {
    hex.push_back(kDigits[byte >> 4]);
    hex.push_back(kDigits[byte & 0x0f]);
  }
  return hex;
}

std::string md5_hex(const std::string& data){
    auto ctx = new_md5_context();
    if(!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return "";
    return finish_hex(ctx.get()).value_or("");
}

std::optional<std::string> md5_file_hex(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if(!in) return std::nullopt;

  auto ctx = new_md5_context();
  if(!ctx) return std::nullopt;

  std::vector<char> buffer(kDigestReadSize);
  for(;;) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if(got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), got) != 1) return std::nullopt;
    if(in.bad()) return std::nullopt;
    if(!in) break;
  }
  return finish_hex(ctx.get());
}

bool is_md5_hex(const std::string& value) {
  if(value.size() != 32) return false;
  return std::all_of(value.begin(), value.end(),
                     [](unsigned char ch){ return std::isxdigit(ch) != 0; });
}

// 512b, 1.5K, 10M, 2.25G
std::string format_size(uint64_t bytes) {
  if(bytes < 1024) return fmt::format("{}b", bytes);
  const char* unit = "KMGTP";
  double scaled = static_cast<double>(bytes) / 1024.0;
  for(; scaled >= 1024.0 && unit[1] != '\0'; ++unit) scaled /= 1024.0;
  const int precision = scaled >= 100 ? 0 : (scaled >= 10 ? 1 : 2);
  std::string text = fmt::format("{:.{}f}", scaled, precision);
  if(text.find('.') != std::string::npos) {
    text.erase(text.find_last_not_of('0') + 1);
    if(text.back() == '.') text.pop_back();
  }
  return text + *unit;
}

std::string format_duration_compact(std::chrono::steady_clock::duration elapsed) {
  const double seconds = std::chrono::duration<double>(elapsed).count();
  if(seconds >= 3600.0) return fmt::format("{:.1f}h", seconds / 3600.0);
  if(seconds >= 60.0) return fmt::format("{:.1f}m", seconds / 60.0);
  return fmt::format("{:.{}f}s", seconds, seconds >= 10.0 ? 0 : 1);
}

std::string trim_copy(std::string value) {
  static const char* const kBlank = " \t\r\n\f\v";
  const auto last = value.find_last_not_of(kBlank);
  if(last == std::string::npos) return std::string();
  value.erase(last + 1);
  value.erase(0, value.find_first_not_of(kBlank));
  return value;
}

std::string to_lower(std::string value) {
  for(auto& ch : value) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return value;
}
