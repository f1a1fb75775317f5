#include "transition_controller.hpp"

#include <algorithm>

namespace vnstage {

const char* to_string(FadeState state) {
    switch (state) {
        case FadeState::FadeIn:  return "fade-in";
        case FadeState::Visible: return "visible";
        case FadeState::FadeOut: return "fade-out";
    }
    return "visible";
}

const char* fade_class(FadeState state) {
    switch (state) {
        case FadeState::FadeIn:  return "sprite-fade-in";
        case FadeState::Visible: return "sprite-visible";
        case FadeState::FadeOut: return "sprite-fade-out";
    }
    return "sprite-visible";
}

TransitionController::TransitionController(Scheduler& scheduler, TransitionTimings timings)
: scheduler_(scheduler), timings_(timings) {}

TransitionController::~TransitionController() {
    cancel();
}

FadeState TransitionController::fade_state() const {
    switch (phase_) {
        case Phase::FadeOut: return FadeState::FadeOut;
        case Phase::FadeIn:  return FadeState::FadeIn;
        case Phase::Visible: return FadeState::Visible;
        case Phase::NoSprite: return FadeState::FadeIn;
    }
    return FadeState::Visible;
}

void TransitionController::cancel() {
    if (timer_ != Scheduler::kNoTimer) {
        scheduler_.cancel(timer_);
        timer_ = Scheduler::kNoTimer;
    }
}

void TransitionController::set_resolved_url(const std::string& url) {
    if (url.empty()) {
        return;
    }

    switch (phase_) {
    case Phase::NoSprite:
        resolved_url_ = url;
        display_url_ = url;
        phase_ = Phase::Visible;
        phase_started_ms_ = scheduler_.now();
        phase_duration_ms_ = 0;
        return;

    case Phase::Visible:
        resolved_url_ = url;
        if (url != display_url_) {
            enter_fade_out();
        }
        return;

    case Phase::FadeOut:
        if (url == resolved_url_) {
            return;
        }
        resolved_url_ = url;
        if (url == display_url_) {
            // Target reverted before the swap: bring the current portrait back in.
            enter_fade_in();
            return;
        }
        enter_fade_out();
        return;

    case Phase::FadeIn:
        if (url == resolved_url_) {
            return;
        }
        resolved_url_ = url;
        enter_fade_out();
        return;
    }
}

void TransitionController::start_timer(std::uint64_t delay_ms, void (TransitionController::*handler)()) {
    cancel();
    phase_started_ms_ = scheduler_.now();
    phase_duration_ms_ = delay_ms;
    timer_ = scheduler_.schedule(delay_ms, [this, handler]() {
        timer_ = Scheduler::kNoTimer;
        (this->*handler)();
    });
}

void TransitionController::enter_fade_out() {
    phase_ = Phase::FadeOut;
    start_timer(timings_.fade_out_ms, &TransitionController::on_fade_out_elapsed);
}

void TransitionController::enter_fade_in() {
    phase_ = Phase::FadeIn;
    start_timer(timings_.fade_in_ms, &TransitionController::on_fade_in_elapsed);
}

void TransitionController::on_fade_out_elapsed() {
    if (display_url_ != resolved_url_) {
        display_url_ = resolved_url_;
        ++display_swaps_;
    }
    enter_fade_in();
}

void TransitionController::on_fade_in_elapsed() {
    phase_ = Phase::Visible;
    phase_started_ms_ = scheduler_.now();
    phase_duration_ms_ = 0;
}

float TransitionController::phase_progress(std::uint64_t now_ms) const {
    if ((phase_ != Phase::FadeOut && phase_ != Phase::FadeIn) || phase_duration_ms_ == 0) {
        return 1.0f;
    }
    if (now_ms <= phase_started_ms_) {
        return 0.0f;
    }
    const double elapsed = static_cast<double>(now_ms - phase_started_ms_);
    return static_cast<float>(std::min(1.0, elapsed / static_cast<double>(phase_duration_ms_)));
}

}
