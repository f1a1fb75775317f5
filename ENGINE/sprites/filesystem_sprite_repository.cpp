#include "filesystem_sprite_repository.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "core/errors.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace fs = std::filesystem;

namespace vnstage {

FilesystemSpriteRepository::FilesystemSpriteRepository(fs::path root)
: root_(std::move(root)) {}

bool FilesystemSpriteRepository::is_sprite_file(const fs::path& path) {
    const std::string ext = strings::to_lower_copy(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".webp";
}

bool FilesystemSpriteRepository::is_safe_directory_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find_first_of("/\\:") != std::string::npos) return false;
    return name.find("..") == std::string::npos;
}

fs::path FilesystemSpriteRepository::sprite_dir_for(const Character& character) const {
    std::error_code ec;
    if (is_safe_directory_name(character.name)) {
        fs::path by_name = root_ / character.name / "sprites";
        if (fs::is_directory(by_name, ec)) {
            return by_name;
        }
    } else if (!character.name.empty()) {
        vnstage::log::warn("[SpriteRepository] Name '" + character.name + "' is not a plain directory name; "
                           "looking up sprites by id only.");
    }
    fs::path by_id = root_ / std::to_string(character.id) / "sprites";
    ec.clear();
    if (fs::is_directory(by_id, ec)) {
        return by_id;
    }
    return {};
}

std::vector<Sprite> FilesystemSpriteRepository::scan_directory(const fs::path& dir, const Character& character) const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw StorageUnavailable("Unable to list '" + dir.generic_string() + "': " + ec.message());
    }
    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && is_sprite_file(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw StorageUnavailable("Failed while listing '" + dir.generic_string() + "': " + ec.message());
    }
    std::sort(files.begin(), files.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename().string() < b.filename().string(); });

    std::vector<Sprite> sprites;
    sprites.reserve(files.size());
    for (const auto& file : files) {
        const std::string filename = file.filename().string();
        auto known = std::find_if(character.sprites.begin(), character.sprites.end(),
                                  [&](const Sprite& s) { return s.filename == filename; });
        Sprite sprite;
        sprite.filename = filename;
        sprite.emotion = (known != character.sprites.end() && !known->emotion.empty())
            ? known->emotion
            : file.stem().string();
        sprites.push_back(std::move(sprite));
    }
    return sprites;
}

std::future<std::vector<Sprite>> FilesystemSpriteRepository::scan_and_sync(const Character& character) {
    return std::async(std::launch::async, [this, character]() {
        const fs::path dir = sprite_dir_for(character);
        {
            std::lock_guard<std::mutex> lock(dirs_mutex_);
            if (dir.empty()) {
                dirs_by_id_.erase(character.id);
            } else {
                dirs_by_id_[character.id] = dir;
            }
        }
        if (dir.empty()) {
            vnstage::log::debug("[SpriteRepository] No sprite directory for '" + character.name + "'.");
            return std::vector<Sprite>{};
        }
        auto sprites = scan_directory(dir, character);
        vnstage::log::debug("[SpriteRepository] Scanned " + std::to_string(sprites.size()) +
                            " sprite(s) for '" + character.name + "'.");
        return sprites;
    });
}

std::string FilesystemSpriteRepository::materialize(CharacterId character_id, const std::string& filename) const {
    fs::path dir;
    {
        std::lock_guard<std::mutex> lock(dirs_mutex_);
        auto it = dirs_by_id_.find(character_id);
        if (it == dirs_by_id_.end()) {
            throw StorageUnavailable("No scanned sprite directory for character " + std::to_string(character_id));
        }
        dir = it->second;
    }
    const fs::path file = dir / filename;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        throw StorageUnavailable("Sprite file missing: '" + file.generic_string() + "'");
    }
    fs::path absolute = fs::absolute(file, ec);
    if (ec) {
        throw StorageUnavailable("Unable to resolve '" + file.generic_string() + "': " + ec.message());
    }
    return "file://" + absolute.lexically_normal().generic_string();
}

std::future<std::string> FilesystemSpriteRepository::load_as_url(CharacterId character_id, const std::string& filename) {
    return std::async(std::launch::async, [this, character_id, filename]() {
        return materialize(character_id, filename);
    });
}

}
