
#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace conduit::net {

/**
 * @brief A pool of threads running one boost::asio::io_context, as used by `HttpServer`.
 */
class AsioExecutionContext {
private:
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  mutable boost::asio::io_context io_context_;
  std::size_t size_;
  std::vector<std::thread> pool_;
  std::optional<WorkGuard> work_;

public:
  explicit AsioExecutionContext(std::size_t thread_pool_size = 0)
      : size_{thread_pool_size == 0 ? std::thread::hardware_concurrency() : thread_pool_size} {
    if (size_ == 0)
      size_ = 1;
    pool_.reserve(size_);
  }
  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;
  ~AsioExecutionContext() {
    stop();
    join();
  }

  /** @brief Run the pool; the threads keep running until `stop()` */
  void run() {
    if (is_running())
      return;
    work_.emplace(io_context_.get_executor());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Abandon outstanding work, and return the threads from `run` */
  void stop() {
    work_.reset();
    io_context_.stop();
  }

  /** @brief Wait for the threads to finish */
  void join() {
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  /** @brief Return the executor for running jobs on the server pool */
  auto get_executor() const { return io_context_.get_executor(); }

  /** @brief Direct access to the underlying io_context */
  boost::asio::io_context& io_context() { return io_context_; }
};

} // namespace conduit::net
