#include "async_completion_queue.hpp"

#include <exception>
#include <string>

#include "utils/log.hpp"

namespace vnstage {

AsyncCompletionQueue::AsyncCompletionQueue() = default;

AsyncCompletionQueue::~AsyncCompletionQueue() {
    if (!pending_.empty()) {
        vnstage::log::debug("[AsyncCompletionQueue] Dropping " + std::to_string(pending_.size()) +
                            " undelivered completion(s) on shutdown.");
    }
}

void AsyncCompletionQueue::update() {
    std::vector<std::unique_ptr<Pending>> ready;
    auto it = pending_.begin();
    while (it != pending_.end()) {
        if ((*it)->ready()) {
            ready.push_back(std::move(*it));
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& entry : ready) {
        try {
            entry->deliver();
        } catch (const std::exception& ex) {
            vnstage::log::error(std::string("[AsyncCompletionQueue] Continuation threw: ") + ex.what());
        }
    }
}

void AsyncCompletionQueue::clear() {
    pending_.clear();
}

}
