#include <opf/core/context.h>

#include <algorithm>

namespace opf {

Context::Context() : state_(std::make_shared<State>()) {}

Context Context::derive(std::optional<Clock::time_point> deadline) const {
    auto child = std::make_shared<State>();
    child->parent = state_;

    child->deadline = state_->deadline;
    if (deadline) {
        child->deadline = child->deadline ? std::min(*child->deadline, *deadline) : *deadline;
    }

    auto* source = &child->source;
    child->parentLink.emplace(state_->source.get_token(),
                              std::function<void()>([source] { source->request_stop(); }));
    return Context{std::move(child)};
}

Context Context::withCancel() const {
    return derive(std::nullopt);
}

Context Context::withTimeout(std::chrono::milliseconds timeout) const {
    return derive(Clock::now() + timeout);
}

Context Context::withDeadline(Clock::time_point deadline) const {
    return derive(deadline);
}

void Context::cancel() const noexcept {
    state_->source.request_stop();
}

bool Context::cancelled() const noexcept {
    return state_->source.stop_requested();
}

bool Context::expired() const noexcept {
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::optional<Context::Clock::time_point> Context::deadline() const noexcept {
    return state_->deadline;
}

std::stop_token Context::stopToken() const noexcept {
    return state_->source.get_token();
}

Error Context::err() const {
    if (cancelled()) {
        return Error{ErrorCode::OperationCancelled, "context cancelled"};
    }
    if (expired()) {
        return Error{ErrorCode::Timeout, "context deadline exceeded"};
    }
    return Error{};
}

} // namespace opf
