#pragma once

#include <stdexcept>
#include <string>

namespace vnstage {

// Thrown by sprite repositories when an inventory scan or URL materialization fails.
class StorageUnavailable : public std::runtime_error {
public:
    explicit StorageUnavailable(const std::string& what)
    : std::runtime_error(what) {}
};

}
