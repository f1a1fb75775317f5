#pragma once

#include <future>
#include <string>
#include <vector>

#include "model/records.hpp"

namespace vnstage {

// Read-only view of a character's emotion-tagged art. Both calls may complete on
// another thread; failures surface as StorageUnavailable through the future (or,
// for an implementation that cannot even start the request, thrown directly).
class SpriteRepository {
public:
    virtual ~SpriteRepository() = default;

    virtual std::future<std::vector<Sprite>> scan_and_sync(const Character& character) = 0;
    virtual std::future<std::string> load_as_url(CharacterId character_id, const std::string& filename) = 0;
};

}
