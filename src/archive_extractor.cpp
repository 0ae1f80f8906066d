#include "archive_extractor.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>

#include "transfer_error.hpp"

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

constexpr int kExtractFlags = ARCHIVE_EXTRACT_TIME |
                              ARCHIVE_EXTRACT_PERM |
                              ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                              ARCHIVE_EXTRACT_SECURE_SYMLINKS;

// Member names are re-rooted under an absolute destination, so absolute
// names are rejected here instead of through ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS.
// Every member must also sit inside root_name, the target's own directory.
bool is_safe_member_name(const std::string& name, const std::filesystem::path& root_name) {
  if(name.empty() || name.front() == '/') return false;
  const std::filesystem::path member(name);
  if(member.begin() == member.end() || *member.begin() != root_name) return false;
  for(const auto& part : member) {
    if(part == "..") return false;
  }
  return true;
}

std::string archive_message(struct archive* a) {
  const char* msg = archive_error_string(a);
  return msg ? std::string(msg) : std::string("(no detail)");
}

TransferError extraction_error(const std::string& message) {
  return TransferError(TransferErrorKind::ExtractionFailed, TransferStage::Extracting, message);
}

struct ReadArchiveDeleter {
  void operator()(struct archive* a) const { archive_read_free(a); }
};

struct WriteArchiveDeleter {
  void operator()(struct archive* a) const { archive_write_free(a); }
};

using ReadArchive = std::unique_ptr<struct archive, ReadArchiveDeleter>;
using WriteArchive = std::unique_ptr<struct archive, WriteArchiveDeleter>;

void copy_data(struct archive* reader, struct archive* writer, const std::string& entry_name) {
  const void* block = nullptr;
  size_t size = 0;
  la_int64_t offset = 0;
  for(;;) {
    int rc = archive_read_data_block(reader, &block, &size, &offset);
    if(rc == ARCHIVE_EOF) return;
    if(rc < ARCHIVE_WARN) {
      throw extraction_error("reading " + entry_name + ": " + archive_message(reader));
    }
    if(archive_write_data_block(writer, block, size, offset) < ARCHIVE_WARN) {
      throw extraction_error("writing " + entry_name + ": " + archive_message(writer));
    }
  }
}

} // namespace

ArchiveExtractor::ArchiveExtractor(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

void ArchiveExtractor::unpack(const std::filesystem::path& archive,
                              const std::filesystem::path& destination,
                              const std::filesystem::path& root_name) const {
  ReadArchive reader(archive_read_new());
  WriteArchive writer(archive_write_disk_new());
  if(!reader || !writer) throw extraction_error("libarchive allocation failed");

  archive_read_support_format_tar(reader.get());
  archive_read_support_filter_all(reader.get());
  archive_write_disk_set_options(writer.get(), kExtractFlags);
  archive_write_disk_set_standard_lookup(writer.get());

  if(archive_read_open_filename(reader.get(), archive.c_str(), kReadBlockSize) != ARCHIVE_OK) {
    throw extraction_error("cannot open " + archive.string() + ": " + archive_message(reader.get()));
  }

  std::size_t entries = 0;
  struct archive_entry* entry = nullptr;
  for(;;) {
    int rc = archive_read_next_header(reader.get(), &entry);
    if(rc == ARCHIVE_EOF) break;
    if(rc < ARCHIVE_WARN) {
      throw extraction_error("bad header in " + archive.string() + ": " + archive_message(reader.get()));
    }
    if(rc == ARCHIVE_WARN) {
      log_warn(logger_.get(), "extract: {}", archive_message(reader.get()));
    }

    const char* raw_name = archive_entry_pathname(entry);
    const std::string name = raw_name ? raw_name : "";
    if(!is_safe_member_name(name, root_name)) {
      throw extraction_error("refusing member '" + name + "' outside " + root_name.string());
    }
    const auto full_path = (destination / name).string();
    archive_entry_copy_pathname(entry, full_path.c_str());

    // hard links are stored relative to the archive root as well
    if(const char* link = archive_entry_hardlink(entry)) {
      if(!is_safe_member_name(link, root_name)) {
        throw extraction_error("refusing hard link " + name + " -> " + link);
      }
      const auto full_link = (destination / link).string();
      archive_entry_copy_hardlink(entry, full_link.c_str());
    }

    rc = archive_write_header(writer.get(), entry);
    if(rc < ARCHIVE_WARN) {
      throw extraction_error("refusing " + name + ": " + archive_message(writer.get()));
    }
    if(archive_entry_size(entry) > 0) {
      copy_data(reader.get(), writer.get(), name);
    }
    if(archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
      throw extraction_error("finishing " + name + ": " + archive_message(writer.get()));
    }
    log_debug(logger_.get(), "extract: {}", name);
    ++entries;
  }

  if(archive_write_close(writer.get()) != ARCHIVE_OK) {
    throw extraction_error("closing output: " + archive_message(writer.get()));
  }
  archive_read_close(reader.get());
  if(entries == 0) throw extraction_error(archive.string() + " holds no members");
}

void ArchiveExtractor::extract(const std::filesystem::path& archive,
                               const std::filesystem::path& target) const {
  std::error_code ec;
  if(std::filesystem::exists(target, ec)) {
    log_info(logger_.get(), "replacing existing {}", target.string());
    std::filesystem::remove_all(target, ec);
    if(ec) throw extraction_error("cannot remove old " + target.string() + ": " + ec.message());
  }

  const auto parent = target.has_parent_path() ? target.parent_path() : std::filesystem::path(".");
  std::filesystem::create_directories(parent, ec);
  if(ec) throw extraction_error("cannot create " + parent.string() + ": " + ec.message());
  // symlink-free absolute root; SECURE_SYMLINKS checks every component
  const auto destination = std::filesystem::canonical(parent, ec);
  if(ec) throw extraction_error("cannot resolve " + parent.string() + ": " + ec.message());

  try {
    unpack(archive, destination, target.filename());
    if(!std::filesystem::is_directory(target, ec)) {
      throw extraction_error(archive.string() + " did not produce " + target.string());
    }
  } catch(const TransferError&) {
    std::filesystem::remove_all(target, ec);
    throw;
  }
  log_info(logger_.get(), "extracted into {}", target.string());
}
