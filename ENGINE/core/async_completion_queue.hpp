#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <utility>
#include <vector>

namespace vnstage {

// Parks futures produced by worker threads and hands each one back to its
// continuation on the UI loop once it is ready. Never blocks the loop.
class AsyncCompletionQueue {
public:
    AsyncCompletionQueue();
    ~AsyncCompletionQueue();

    AsyncCompletionQueue(const AsyncCompletionQueue&) = delete;
    AsyncCompletionQueue& operator=(const AsyncCompletionQueue&) = delete;

    template <typename T>
    void watch(std::future<T> future, std::function<void(std::future<T>&)> continuation) {
        if (!continuation) return;
        pending_.push_back(std::make_unique<PendingFuture<T>>(std::move(future), std::move(continuation)));
    }

    // Delivers ready futures. Continuations may watch() new futures; those are
    // picked up on a later update().
    void update();

    bool is_busy() const { return !pending_.empty(); }
    std::size_t size() const { return pending_.size(); }

    // Drops every pending continuation without running it. Worker threads already
    // started still finish; std::async futures join in their destructor.
    void clear();

private:
    struct Pending {
        virtual ~Pending() = default;
        virtual bool ready() const = 0;
        virtual void deliver() = 0;
    };

    template <typename T>
    struct PendingFuture : Pending {
        PendingFuture(std::future<T> f, std::function<void(std::future<T>&)> c)
        : future(std::move(f)), continuation(std::move(c)) {}

        bool ready() const override {
            if (!future.valid()) return true;
            return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }

        void deliver() override { continuation(future); }

        std::future<T> future;
        std::function<void(std::future<T>&)> continuation;
    };

    std::vector<std::unique_ptr<Pending>> pending_;
};

}
