#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Existence probe for completed transfers under <root>/<source>/<item>.
class LocalCache {
public:
    LocalCache(std::filesystem::path root,
               std::string marker_file,
               std::vector<std::string> media_extensions);

    std::filesystem::path entry_path(const std::string& source_id,
                                     const std::string& item_id) const;

    // True when the entry holds a non-empty marker file or any media file.
    bool has_entry(const std::string& source_id, const std::string& item_id) const;

    std::optional<std::filesystem::path> local_path(const std::string& source_id,
                                                    const std::string& item_id) const;

private:
    bool has_media_file(const std::filesystem::path& dir) const;

    std::filesystem::path root_;
    std::string marker_file_;
    std::vector<std::string> media_extensions_; // lower-case, with leading dot
};
