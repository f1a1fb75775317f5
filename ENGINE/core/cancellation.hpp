#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace vnstage {

class CancellationToken {
public:
    CancellationToken() = default;

    bool cancelled() const { return !flag_ || flag_->load(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
    : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

// Owned by whatever scopes the work (a slot, a stage session). Cancels on destruction.
class CancellationSource {
public:
    CancellationSource()
    : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    ~CancellationSource() { cancel(); }

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationToken token() const { return CancellationToken(flag_); }
    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}
