#include "chunk_assembler.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "transfer_error.hpp"
#include "transfer_task.hpp"
#include "utils.hpp"

namespace {

TransferError assembly_error(TransferErrorKind kind, const std::string& message) {
  return TransferError(kind, TransferStage::Assembling, message);
}

// Reads exactly length bytes starting at offset.
bool read_range(const std::filesystem::path& path, uint64_t offset, uint64_t length, std::vector<char>& out) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return false;
  in.seekg(static_cast<std::streamoff>(offset));
  out.resize(static_cast<std::size_t>(length));
  if(length == 0) return true;
  in.read(out.data(), static_cast<std::streamsize>(length));
  return static_cast<uint64_t>(in.gcount()) == length;
}

} // namespace

ChunkAssembler::ChunkAssembler(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void ChunkAssembler::check_part_sizes(const TransferTask& task, const std::vector<ChunkSpec>& specs) const {
  for(const auto& spec : specs) {
    const auto path = task.part_path(spec.index);
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if(ec) {
      throw assembly_error(TransferErrorKind::SizeMismatch,
                           "chunk part " + path.string() + " is missing: " + ec.message());
    }
    if(size != spec.trim_length) {
      throw assembly_error(TransferErrorKind::SizeMismatch,
                           "chunk part " + std::to_string(spec.index) + " holds " + std::to_string(size) +
                           " bytes, expected " + std::to_string(spec.trim_length));
    }
  }
}

void ChunkAssembler::verify_overlaps(const TransferTask& task, const std::vector<ChunkSpec>& specs) const {
  check_part_sizes(task, specs);

  std::vector<char> tail;
  std::vector<char> head;
  for(std::size_t i = 1; i < specs.size(); ++i) {
    const auto& previous = specs[i - 1];
    const auto& next = specs[i];
    const uint64_t shared = overlap_between(previous, next);
    if(shared == 0) continue;

    // the shared region starts at next.start in archive coordinates
    const uint64_t tail_offset = next.start - previous.start;
    if(!read_range(task.part_path(previous.index), tail_offset, shared, tail) ||
       !read_range(task.part_path(next.index), 0, shared, head)) {
      throw assembly_error(TransferErrorKind::SizeMismatch,
                           "cannot read overlap between chunks " + std::to_string(previous.index) +
                           " and " + std::to_string(next.index));
    }
    if(tail != head) {
      log_error(logger_.get(), "overlap mismatch between chunks {} and {} ({} bytes)",
                previous.index, next.index, shared);
      throw assembly_error(TransferErrorKind::OverlapMismatch,
                           "chunks " + std::to_string(previous.index) + " and " +
                           std::to_string(next.index) + " disagree on their " +
                           std::to_string(shared) + " shared bytes");
    }
  }
  log_debug(logger_.get(), "overlaps verified across {} chunk(s)", specs.size());
}

std::filesystem::path ChunkAssembler::assemble(const TransferTask& task,
                                               const std::vector<ChunkSpec>& specs,
                                               uint64_t archive_size) const {
  std::error_code ec;
  std::filesystem::remove(task.local_archive, ec);
  try {
    verify_overlaps(task, specs);
    write_archive(task, specs, archive_size);
  } catch(const TransferError&) {
    std::filesystem::remove(task.local_archive, ec);
    throw;
  }
  log_info(logger_.get(), "assembled {} ({})", task.local_archive.string(), format_size(archive_size));
  return task.local_archive;
}

void ChunkAssembler::write_archive(const TransferTask& task,
                                   const std::vector<ChunkSpec>& specs,
                                   uint64_t archive_size) const {
  std::error_code ec;
  if(task.local_archive.has_parent_path()) {
    std::filesystem::create_directories(task.local_archive.parent_path(), ec);
  }
  std::ofstream out(task.local_archive, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw assembly_error(TransferErrorKind::LocalIoFailed,
                         "cannot create " + task.local_archive.string());
  }

  std::vector<char> buffer(kAssemblyBufferSize);
  uint64_t written = 0;
  for(std::size_t i = 0; i < specs.size(); ++i) {
    const auto& spec = specs[i];
    const uint64_t skip = i == 0 ? 0 : overlap_between(specs[i - 1], spec);
    std::ifstream in(task.part_path(spec.index), std::ios::binary);
    if(!in) {
      throw assembly_error(TransferErrorKind::LocalIoFailed,
                           "cannot open chunk part " + task.part_path(spec.index).string());
    }
    in.seekg(static_cast<std::streamoff>(skip));
    uint64_t remaining = spec.trim_length - skip;
    while(remaining > 0) {
      const auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
      in.read(buffer.data(), static_cast<std::streamsize>(want));
      const auto got = static_cast<std::size_t>(in.gcount());
      if(got == 0) break;
      out.write(buffer.data(), static_cast<std::streamsize>(got));
      remaining -= got;
      written += got;
    }
    if(!out) {
      throw assembly_error(TransferErrorKind::LocalIoFailed,
                           "write failed on " + task.local_archive.string());
    }
  }
  out.close();
  if(!out) {
    throw assembly_error(TransferErrorKind::LocalIoFailed,
                         "write failed on " + task.local_archive.string());
  }

  if(written != archive_size) {
    throw assembly_error(TransferErrorKind::SizeMismatch,
                         "assembled " + std::to_string(written) + " bytes, expected " +
                         std::to_string(archive_size));
  }
}
