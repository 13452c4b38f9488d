#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace opf {

/**
 * Fixed-size worker pool. The worker count bounds how many tasks run at once;
 * further tasks wait in a FIFO queue until a worker frees up.
 *
 * Destruction stops intake, runs whatever is still queued and joins the workers.
 */
class ThreadPool {
public:
    /**
     * @param num_threads Worker count (0 selects hardware concurrency)
     * @param name Label used in log lines emitted by workers
     */
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency(),
                        std::string name = "opf-pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a task; false when the pool no longer accepts work.
    template <typename F> bool enqueue_detached(F&& f) {
        return push(std::function<void()>(std::forward<F>(f)));
    }

    // Idempotent. Returns after every queued task has run.
    void stop();

    size_t thread_count() const noexcept { return threadCount_; }

private:
    struct Shared {
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<std::function<void()>> pending;
        bool closed{false};
    };

    bool push(std::function<void()> task);
    static void run(const std::shared_ptr<Shared>& shared, const std::string& name,
                    std::stop_token token);

    std::shared_ptr<Shared> shared_;
    std::string name_;
    size_t threadCount_{0};
    std::vector<std::jthread> workers_;
};

} // namespace opf
