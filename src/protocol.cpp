#include "protocol.hpp"

#include "chunk_planner.hpp"

std::string make_source_probe_command(const std::string& source_dir) {
    return "test -d '" + source_dir + "'";
}

std::string make_remove_command(const std::string& archive_path) {
    return "rm -f '" + archive_path + "'";
}

std::string make_pack_command(const std::string& parent_dir,
                              const std::string& archive_path,
                              const std::string& item_dir) {
    return "cd '" + parent_dir + "' && tar -cf '" + archive_path + "' '" + item_dir + "'";
}

std::string make_size_command(const std::string& archive_path) {
    return "stat -c %s '" + archive_path + "'";
}

std::string make_fetch_command(const std::string& archive_path,
                               uint64_t block_size,
                               const ChunkSpec& spec) {
    return "dd if='" + archive_path + "'" +
           " bs=" + std::to_string(block_size) +
           " skip=" + std::to_string(spec.skip_blocks) +
           " count=" + std::to_string(spec.count_blocks) +
           " iflag=fullblock 2>/dev/null | base64 -w 0";
}

std::string make_checksum_command(const std::string& archive_path) {
    return "md5sum '" + archive_path + "'";
}

std::string make_channel_probe_command() {
    return std::string("echo ") + kChannelProbeToken;
}
