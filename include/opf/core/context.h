#pragma once

#include <opf/core/types.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

namespace opf {

/**
 * Cancellation and deadline signal passed to every blocking operation.
 *
 * A Context is a cheap, copyable handle onto shared state. Copies observe the
 * same cancellation; derived contexts (withCancel/withTimeout/withDeadline) are
 * cancelled when their parent is, and inherit the earlier of the two deadlines.
 *
 * @code
 * auto ctx = Context::background().withTimeout(std::chrono::milliseconds{50});
 * auto res = session->call(ctx, "Echo", payload);
 * if (!res && res.error().code == ErrorCode::Timeout) { ... }
 * @endcode
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context();

    static Context background() { return Context{}; }

    [[nodiscard]] Context withCancel() const;
    [[nodiscard]] Context withTimeout(std::chrono::milliseconds timeout) const;
    [[nodiscard]] Context withDeadline(Clock::time_point deadline) const;

    void cancel() const noexcept;

    bool cancelled() const noexcept;
    bool expired() const noexcept;
    bool done() const noexcept { return cancelled() || expired(); }

    std::optional<Clock::time_point> deadline() const noexcept;
    std::stop_token stopToken() const noexcept;

    // OperationCancelled or Timeout once done(); Success otherwise.
    Error err() const;

    // Blocks on cv until pred() holds or the context is done. Returns pred().
    template <typename Lock, typename Predicate>
    bool wait(std::condition_variable_any& cv, Lock& lock, Predicate pred) const {
        if (auto dl = deadline()) {
            return cv.wait_until(lock, stopToken(), *dl, std::move(pred));
        }
        return cv.wait(lock, stopToken(), std::move(pred));
    }

private:
    struct State {
        std::stop_source source;
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<State> parent;
        // Declared last so it deregisters before the source it targets is destroyed.
        std::optional<std::stop_callback<std::function<void()>>> parentLink;
    };

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    Context derive(std::optional<Clock::time_point> deadline) const;

    std::shared_ptr<State> state_;
};

} // namespace opf
