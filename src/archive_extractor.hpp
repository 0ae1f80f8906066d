#pragma once

#include <filesystem>
#include <memory>

#include "log.hpp"

// Unpacks a tar archive whose single top-level directory is the cache target.
class ArchiveExtractor {
public:
  explicit ArchiveExtractor(std::shared_ptr<Logger> logger = nullptr);

  // Replaces target with the archive's copy of it; members land under
  // target.parent_path(). Members outside target's own directory, absolute
  // paths, ".." and writes through symlinks are refused. Throws TransferError (ExtractionFailed) and leaves no
  // partial target behind.
  void extract(const std::filesystem::path& archive, const std::filesystem::path& target) const;

private:
  void unpack(const std::filesystem::path& archive,
              const std::filesystem::path& destination,
              const std::filesystem::path& root_name) const;

  std::shared_ptr<Logger> logger_;
};
