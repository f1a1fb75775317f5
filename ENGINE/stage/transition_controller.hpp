#pragma once

#include <cstdint>
#include <string>

#include "core/scheduler.hpp"
#include "core/stage_settings.hpp"

namespace vnstage {

enum class FadeState {
    FadeIn,
    Visible,
    FadeOut,
};

const char* to_string(FadeState state);

// CSS-style class consumed by the presentation layer: sprite-fade-in, sprite-visible, sprite-fade-out.
const char* fade_class(FadeState state);

// Fade state machine for one portrait slot. The first URL is shown immediately; every
// later change runs Visible -> FadeOut -> FadeIn -> Visible, swapping the displayed URL
// only when FadeOut expires. A change during a pending dwell restarts from FadeOut with
// the newest URL.
class TransitionController {
public:
    enum class Phase {
        NoSprite,
        Visible,
        FadeOut,
        FadeIn,
    };

    TransitionController(Scheduler& scheduler, TransitionTimings timings);
    ~TransitionController();

    TransitionController(const TransitionController&) = delete;
    TransitionController& operator=(const TransitionController&) = delete;

    void set_resolved_url(const std::string& url);

    // Drops any pending dwell timer; the displayed URL stays as is.
    void cancel();

    Phase phase() const { return phase_; }
    FadeState fade_state() const;
    const std::string& resolved_url() const { return resolved_url_; }
    const std::string& display_url() const { return display_url_; }
    bool has_pending_timer() const { return timer_ != Scheduler::kNoTimer; }

    // 0..1 through the current dwell; 1 when not fading.
    float phase_progress(std::uint64_t now_ms) const;

    // How many times display_url has been replaced after the initial reveal.
    int display_swaps() const { return display_swaps_; }

private:
    void enter_fade_out();
    void enter_fade_in();
    void on_fade_out_elapsed();
    void on_fade_in_elapsed();
    void start_timer(std::uint64_t delay_ms, void (TransitionController::*handler)());

    Scheduler&        scheduler_;
    TransitionTimings timings_;
    Phase             phase_ = Phase::NoSprite;
    std::string       resolved_url_;
    std::string       display_url_;
    Scheduler::TimerId timer_ = Scheduler::kNoTimer;
    std::uint64_t     phase_started_ms_ = 0;
    std::uint64_t     phase_duration_ms_ = 0;
    int               display_swaps_ = 0;
};

}
