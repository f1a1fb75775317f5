#include "scheduler.hpp"

#include <algorithm>
#include <utility>

namespace vnstage {

Scheduler::TimerId Scheduler::schedule(std::uint64_t delay_ms, Command command) {
    if (!command) {
        return kNoTimer;
    }
    Entry entry;
    entry.id = next_id_++;
    entry.due_ms = now_ms_ + delay_ms;
    entry.command = std::move(command);
    entries_.push_back(std::move(entry));
    return entries_.back().id;
}

bool Scheduler::cancel(TimerId id) {
    if (id == kNoTimer) {
        return false;
    }
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool Scheduler::is_pending(TimerId id) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [id](const Entry& e) { return e.id == id; });
}

void Scheduler::advance_to(std::uint64_t now_ms) {
    if (now_ms < now_ms_) {
        return;
    }
    while (true) {
        auto next = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->due_ms > now_ms) continue;
            if (next == entries_.end() ||
                it->due_ms < next->due_ms ||
                (it->due_ms == next->due_ms && it->id < next->id)) {
                next = it;
            }
        }
        if (next == entries_.end()) {
            break;
        }
        Entry entry = std::move(*next);
        entries_.erase(next);
        now_ms_ = std::max(now_ms_, entry.due_ms);
        entry.command();
    }
    now_ms_ = now_ms;
}

}
