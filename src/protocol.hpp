#pragma once
#include <cstdint>
#include <string>

struct ChunkSpec;

// protocol.hpp: command strings sent over the exec channel. They must stay
// byte-for-byte stable; the remote side is a stock toybox/coreutils shell.
inline constexpr const char* kChannelProbeToken = "__tarpull_probe__";

std::string make_source_probe_command(const std::string& source_dir);
std::string make_remove_command(const std::string& archive_path);
std::string make_pack_command(const std::string& parent_dir,
                              const std::string& archive_path,
                              const std::string& item_dir);
std::string make_size_command(const std::string& archive_path);
std::string make_fetch_command(const std::string& archive_path,
                               uint64_t block_size,
                               const ChunkSpec& spec);
std::string make_checksum_command(const std::string& archive_path);
std::string make_channel_probe_command();
