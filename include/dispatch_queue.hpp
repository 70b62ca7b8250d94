// File: dispatch_queue.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace net = boost::asio;

/// Serial executor: an io_context driven by exactly one worker thread.
/// Work runs one item at a time, in submission order.
class DispatchQueue
{
public:
    explicit DispatchQueue(std::string label);
    ~DispatchQueue();

    DispatchQueue(const DispatchQueue &) = delete;
    DispatchQueue &operator=(const DispatchQueue &) = delete;

    /// Schedules work and returns immediately.
    void async(std::function<void()> work);

    /// Schedules work and blocks until it ran. Runs inline when called from the queue.
    void sync(const std::function<void()> &work);

    /// Blocks until every item submitted before this call has run.
    void drain();

    bool isCurrent() const;
    const std::string &label() const;

private:
    void run();

    std::string label_;
    std::shared_ptr<net::io_context> ioc_;
    net::executor_work_guard<net::io_context::executor_type> workGuard_;
    std::thread worker_;
    std::atomic<std::thread::id> workerId_;
};
