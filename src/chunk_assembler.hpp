#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "chunk_planner.hpp"
#include "log.hpp"

struct TransferTask;

inline constexpr std::size_t kAssemblyBufferSize = 1024 * 1024;

// Checks that neighbouring part files agree on their shared bytes, then
// concatenates them into task.local_archive with the overlaps removed.
class ChunkAssembler {
public:
  explicit ChunkAssembler(std::shared_ptr<Logger> logger = nullptr);

  // Throws TransferError (SizeMismatch, OverlapMismatch).
  void verify_overlaps(const TransferTask& task, const std::vector<ChunkSpec>& specs) const;

  // Verifies, then writes the archive. On any failure the output file is
  // removed before the TransferError propagates. Returns the archive path.
  std::filesystem::path assemble(const TransferTask& task,
                                 const std::vector<ChunkSpec>& specs,
                                 uint64_t archive_size) const;

private:
  void check_part_sizes(const TransferTask& task, const std::vector<ChunkSpec>& specs) const;
  void write_archive(const TransferTask& task,
                     const std::vector<ChunkSpec>& specs,
                     uint64_t archive_size) const;

  std::shared_ptr<Logger> logger_;
};
