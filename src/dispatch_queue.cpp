// File: dispatch_queue.cpp
#include "dispatch_queue.hpp"
#include "logger.hpp"
#include <future>
#include <exception>

DispatchQueue::DispatchQueue(std::string label)
    : label_(std::move(label)),
      ioc_(std::make_shared<net::io_context>(1)),
      workGuard_(net::make_work_guard(*ioc_))
{
    worker_ = std::thread(&DispatchQueue::run, this);
}

DispatchQueue::~DispatchQueue()
{
    workGuard_.reset();
    ioc_->stop();

    if (!worker_.joinable())
    {
        return;
    }

    if (isCurrent())
    {
        // Destroyed from one of our own work items. The worker keeps the
        // io_context alive until run() returns.
        Logger::Log(LogLevel::DEBUG, "DispatchQueue::~DispatchQueue: Destroyed from its own worker, detaching: " + label_);
        worker_.detach();
        return;
    }
    worker_.join();
}

void DispatchQueue::async(std::function<void()> work)
{
    net::post(*ioc_, std::move(work));
}

void DispatchQueue::sync(const std::function<void()> &work)
{
    if (isCurrent())
    {
        work();
        return;
    }

    std::promise<void> done;
    auto future = done.get_future();
    net::post(*ioc_, [&work, &done]()
              {
        try
        {
            work();
            done.set_value();
        }
        catch (...)
        {
            done.set_exception(std::current_exception());
        } });
    future.get();
}

void DispatchQueue::drain()
{
    sync([] {});
}

bool DispatchQueue::isCurrent() const
{
    return workerId_.load() == std::this_thread::get_id();
}

const std::string &DispatchQueue::label() const
{
    return label_;
}

void DispatchQueue::run()
{
    workerId_ = std::this_thread::get_id();
    Logger::Log(LogLevel::DEBUG, "DispatchQueue::run: Worker started for " + label_);

    // Local copy: run() may outlive this object when the queue is destroyed by its own work.
    auto ioc = ioc_;
    std::string label = label_;
    for (;;)
    {
        try
        {
            ioc->run();
            break;
        }
        catch (const std::exception &e)
        {
            Logger::Log(LogLevel::ERROR, "DispatchQueue::run: Work item on " + label + " threw: " + std::string(e.what()));
        }
    }
    Logger::Log(LogLevel::DEBUG, "DispatchQueue::run: Worker exiting for " + label);
}
