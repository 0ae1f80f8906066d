#include "chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

uint64_t ceil_div(uint64_t value, uint64_t divisor) {
  return value / divisor + (value % divisor != 0 ? 1 : 0);
}

}

bool ChunkSpec::operator==(const ChunkSpec& other) const {
  return index == other.index &&
         start == other.start &&
         length == other.length &&
         skip_blocks == other.skip_blocks &&
         count_blocks == other.count_blocks &&
         trim_length == other.trim_length &&
         lead_offset == other.lead_offset;
}

std::vector<ChunkSpec> plan_chunks(uint64_t archive_size,
                                   uint64_t chunk_size,
                                   uint64_t overlap,
                                   uint64_t block_size) {
  if(chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
  if(block_size == 0) throw std::invalid_argument("block size must be positive");
  if(overlap >= chunk_size) {
    throw std::invalid_argument("overlap " + std::to_string(overlap) +
                                " must be smaller than chunk size " + std::to_string(chunk_size));
  }

  const uint64_t step = chunk_size - overlap;
  const uint64_t total_chunks = std::max<uint64_t>(1, ceil_div(archive_size, step));

  std::vector<ChunkSpec> specs;
  specs.reserve(static_cast<std::size_t>(total_chunks));
  for(uint64_t i = 0; i < total_chunks; ++i) {
    ChunkSpec spec;
    spec.index = static_cast<std::size_t>(i);
    spec.start = i * step;
    const uint64_t end = std::min(spec.start + chunk_size, archive_size);
    spec.length = end - spec.start;
    spec.trim_length = spec.length;
    spec.skip_blocks = spec.start / block_size;
    spec.lead_offset = spec.start - spec.skip_blocks * block_size;
    spec.count_blocks = spec.length == 0 ? 0 : ceil_div(spec.lead_offset + spec.length, block_size);
    specs.push_back(spec);
  }
  return specs;
}

uint64_t overlap_between(const ChunkSpec& previous, const ChunkSpec& next) {
  if(previous.end() <= next.start) return 0;
  return std::min(previous.end() - next.start, next.trim_length);
}
