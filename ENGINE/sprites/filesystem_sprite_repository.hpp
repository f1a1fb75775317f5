#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

#include "sprite_repository.hpp"

namespace vnstage {

// Sprites live under <root>/<character name>/sprites/<emotion>.<ext>. Directories keyed
// by character id (<root>/<id>/sprites) are still read when no name directory exists.
class FilesystemSpriteRepository : public SpriteRepository {
public:
    explicit FilesystemSpriteRepository(std::filesystem::path root);

    std::future<std::vector<Sprite>> scan_and_sync(const Character& character) override;
    std::future<std::string> load_as_url(CharacterId character_id, const std::string& filename) override;

    const std::filesystem::path& root() const { return root_; }

    static bool is_sprite_file(const std::filesystem::path& path);

    // A display name is only used as a directory when it is one plain path component.
    static bool is_safe_directory_name(const std::string& name);

private:
    std::filesystem::path sprite_dir_for(const Character& character) const;
    std::vector<Sprite> scan_directory(const std::filesystem::path& dir, const Character& character) const;
    std::string materialize(CharacterId character_id, const std::string& filename) const;

    std::filesystem::path root_;
    mutable std::mutex dirs_mutex_;
    std::unordered_map<CharacterId, std::filesystem::path> dirs_by_id_;
};

}
