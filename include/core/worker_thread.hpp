#ifndef WORKER_THREAD_HPP
#define WORKER_THREAD_HPP

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>

// std::thread with a completion future, so owners can wait with a deadline
// and report a body that is slow to return. The thread is never detached.
class WorkerThread {
public:
    WorkerThread() = default;
    ~WorkerThread();

    WorkerThread(const WorkerThread&) = delete;
    WorkerThread& operator=(const WorkerThread&) = delete;

    void start(std::string name, std::function<void()> body);

    // True once the body has returned (or was never started).
    bool wait(std::chrono::milliseconds timeout) const;

    // Blocks until the body returns, logging every `progressInterval` while it is still busy.
    void join(std::chrono::milliseconds progressInterval);

    bool joinable() const { return thread_.joinable(); }
    bool done() const;

private:
    std::string name_;
    std::thread thread_;
    std::shared_future<void> finished_;
};

#endif
