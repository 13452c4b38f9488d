#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace opf::transport {

/**
 * Owns an io_context kept alive by a work guard and the threads running it.
 * Each PluginServer / PluginClient owns its own runner; nothing is global.
 */
class IoContextRunner {
public:
    explicit IoContextRunner(std::size_t threads = 1, std::string name = "opf-io");
    ~IoContextRunner();

    IoContextRunner(const IoContextRunner&) = delete;
    IoContextRunner& operator=(const IoContextRunner&) = delete;

    boost::asio::io_context& context() noexcept { return io_context_; }
    boost::asio::any_io_executor executor() { return io_context_.get_executor(); }

    // Release the work guard, stop the context and join the threads. Idempotent.
    void stop();

    bool running() const noexcept { return !threads_.empty(); }

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    boost::asio::io_context io_context_;
    std::optional<WorkGuard> work_guard_;
    std::vector<std::thread> threads_;
    std::string name_;
};

} // namespace opf::transport
