#include <opf/core/thread_pool.h>

#include <spdlog/spdlog.h>

namespace opf {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : shared_(std::make_shared<Shared>()), name_(std::move(name)) {
    threadCount_ = num_threads != 0 ? num_threads : std::thread::hardware_concurrency();
    if (threadCount_ == 0) {
        threadCount_ = 4;
    }

    workers_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back(
            [shared = shared_, label = name_](std::stop_token token) { run(shared, label, token); });
    }
    spdlog::debug("ThreadPool[{}]: started {} workers", name_, threadCount_);
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::push(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->closed) {
            return false;
        }
        shared_->pending.push_back(std::move(task));
    }
    shared_->ready.notify_one();
    return true;
}

void ThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->closed) {
            return;
        }
        shared_->closed = true;
    }
    shared_->ready.notify_all();

    // Workers leave only once the queue is empty.
    workers_.clear();
    spdlog::debug("ThreadPool[{}]: stopped", name_);
}

void ThreadPool::run(const std::shared_ptr<Shared>& shared, const std::string& name,
                     std::stop_token token) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(shared->mutex);
            shared->ready.wait(lock, [&] {
                return shared->closed || token.stop_requested() || !shared->pending.empty();
            });
            if (shared->pending.empty()) {
                return;
            }
            task = std::move(shared->pending.front());
            shared->pending.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("ThreadPool[{}]: task threw: {}", name, e.what());
        }
    }
}

} // namespace opf
