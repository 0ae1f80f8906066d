#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

inline constexpr uint64_t kDefaultChunkSize = 10 * 1024 * 1024;
inline constexpr uint64_t kDefaultOverlap = 1024;
inline constexpr uint64_t kDefaultBlockSize = 1024;

// One planned byte range of the remote archive. The remote read is block
// aligned: it returns count_blocks * block bytes starting at skip_blocks * block,
// so the first lead_offset bytes precede start and anything past
// lead_offset + trim_length is over-read.
struct ChunkSpec {
  std::size_t index = 0;
  uint64_t start = 0;
  uint64_t length = 0;
  uint64_t skip_blocks = 0;
  uint64_t count_blocks = 0;
  uint64_t trim_length = 0;
  uint64_t lead_offset = 0;

  uint64_t end() const { return start + trim_length; }
  bool operator==(const ChunkSpec& other) const;
  bool operator!=(const ChunkSpec& other) const { return !(*this == other); }
};

// Covers [0, archive_size) with chunks of chunk_size bytes whose starts advance
// by chunk_size - overlap. archive_size == 0 yields one zero-length chunk.
// Throws std::invalid_argument when chunk_size or block_size is 0 or overlap >= chunk_size.
std::vector<ChunkSpec> plan_chunks(uint64_t archive_size,
                                   uint64_t chunk_size,
                                   uint64_t overlap,
                                   uint64_t block_size = kDefaultBlockSize);

// Bytes shared by two consecutive chunks.
uint64_t overlap_between(const ChunkSpec& previous, const ChunkSpec& next);
