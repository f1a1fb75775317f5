#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace vnstage {

// Runs delayed commands on the UI loop. Time only moves when advance_to() is called,
// so the same code runs against SDL ticks in the viewer and a manual clock in tests.
class Scheduler {
public:
    using TimerId = std::uint64_t;
    using Command = std::function<void()>;

    static constexpr TimerId kNoTimer = 0;

    TimerId schedule(std::uint64_t delay_ms, Command command);
    bool cancel(TimerId id);

    // Runs every command due at or before now_ms, earliest first. While a command runs,
    // now() reports its due time, so chained schedules keep exact spacing.
    void advance_to(std::uint64_t now_ms);

    std::uint64_t now() const { return now_ms_; }
    std::size_t pending() const { return entries_.size(); }
    bool is_pending(TimerId id) const;

private:
    struct Entry {
        TimerId       id = kNoTimer;
        std::uint64_t due_ms = 0;
        Command       command;
    };

    std::vector<Entry> entries_;
    std::uint64_t now_ms_ = 0;
    TimerId next_id_ = 1;
};

}
