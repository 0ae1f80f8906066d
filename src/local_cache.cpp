#include "local_cache.hpp"

#include "utils.hpp"

LocalCache::LocalCache(std::filesystem::path root,
                       std::string marker_file,
                       std::vector<std::string> media_extensions)
    : root_(std::move(root)),
      marker_file_(std::move(marker_file)) {
    for(auto& ext : media_extensions){
        if(ext.empty()) continue;
        auto lowered = to_lower(ext);
        if(lowered.front() != '.') lowered.insert(lowered.begin(), '.');
        media_extensions_.push_back(std::move(lowered));
    }
}

std::filesystem::path LocalCache::entry_path(const std::string& source_id,
                                             const std::string& item_id) const {
    return root_ / source_id / item_id;
}

bool LocalCache::has_entry(const std::string& source_id, const std::string& item_id) const {
    std::error_code ec;
    auto dir = entry_path(source_id, item_id);
    if(!std::filesystem::is_directory(dir, ec)) return false;

    if(!marker_file_.empty()){
        auto marker = dir / marker_file_;
        if(std::filesystem::is_regular_file(marker, ec)){
            auto size = std::filesystem::file_size(marker, ec);
            if(!ec && size > 0) return true;
        }
    }
    return has_media_file(dir);
}

bool LocalCache::has_media_file(const std::filesystem::path& dir) const {
    if(media_extensions_.empty()) return false;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    if(ec) return false;
    for(; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)){
        if(ec) return false;
        if(!it->is_regular_file(ec)) continue;
        auto ext = to_lower(it->path().extension().string());
        for(const auto& wanted : media_extensions_){
            if(ext == wanted) return true;
        }
    }
    return false;
}

std::optional<std::filesystem::path> LocalCache::local_path(const std::string& source_id,
                                                            const std::string& item_id) const {
    std::error_code ec;
    auto dir = entry_path(source_id, item_id);
    if(std::filesystem::exists(dir, ec)) return dir;
    return std::nullopt;
}
