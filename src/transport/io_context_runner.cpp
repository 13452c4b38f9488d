#include <opf/transport/io_context_runner.h>

#include <spdlog/spdlog.h>

namespace opf::transport {

IoContextRunner::IoContextRunner(std::size_t threads, std::string name) : name_(std::move(name)) {
    if (threads == 0)
        threads = 1;

    work_guard_.emplace(io_context_.get_executor());

    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this, i]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                spdlog::error("IoContextRunner[{}]: worker {} exited with exception: {}", name_,
                              i, e.what());
            }
        });
    }
    spdlog::debug("IoContextRunner[{}]: started {} threads", name_, threads);
}

IoContextRunner::~IoContextRunner() {
    stop();
}

void IoContextRunner::stop() {
    if (work_guard_) {
        work_guard_->reset();
        work_guard_.reset();
    }

    io_context_.stop();

    for (auto& t : threads_) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
            t.join();
        } else if (t.joinable()) {
            t.detach();
        }
    }
    threads_.clear();
}

} // namespace opf::transport
