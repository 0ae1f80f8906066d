#include "exec_channel.hpp"
#include "log.hpp"
#include "transfer_config.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

// Pulls one fixture directory through /bin/sh, the way a device relay would be used.
int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "transfer_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "remote" / "42" / "c_1001" / "80", ec);
  fs::create_directories(base / "remote_tmp", ec);

  auto write = [](const fs::path& path, const std::string& data){
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
    if(!out) throw std::runtime_error("cannot write " + path.string());
  };
  write(base / "remote" / "42" / "c_1001" / "entry.json", "{\"title\":\"sample\"}");
  std::string media;
  for(int i = 0; i < 50000; ++i) media += static_cast<char>('a' + i % 26);
  write(base / "remote" / "42" / "c_1001" / "80" / "video.m4s", media);

  init(false);

  TransferConfig config;
  config.remote_root = (base / "remote").string();
  config.remote_tmp = (base / "remote_tmp").string();
  config.local_cache = base / "cache";
  config.chunk_size = 16 * 1024;
  config.overlap = 512;

  TransferEngine::Options options;
  options.progress = [](std::size_t index, std::size_t count, uint64_t fetched, uint64_t total){
    std::cout << "chunk " << (index + 1) << "/" << count << " "
              << format_size(fetched) << "/" << format_size(total) << "\n";
  };
  TransferEngine engine(std::make_shared<ProcessExecChannel>(ProcessExecChannel::Options{}), config, options);

  std::size_t warnings = 0;
  auto handle = engine.add_log_listener(
    [&](void*, const std::string&, spdlog::level::level_enum level, const std::string&){
      if(level >= spdlog::level::warn) ++warnings;
      return false;
    });

  int rc = 1;
  if(engine.probe_channel()) {
    auto outcome = engine.download_and_extract("42", "c_1001");
    if(outcome.success) {
      std::cout << "extracted to " << outcome.local_path.string()
                << " (md5 " << outcome.digest << ", " << warnings << " warnings)\n";
      rc = 0;
    }
  }
  engine.remove_log_listener(handle);

  fs::remove_all(base, ec);
  return rc;
}
