#include "core/worker_thread.hpp"
#include "core/log.hpp"

#include <exception>
#include <memory>
#include <utility>

WorkerThread::~WorkerThread() {
    if (thread_.joinable()) thread_.join();
}

void WorkerThread::start(std::string name, std::function<void()> body) {
    if (thread_.joinable()) return;

    name_ = std::move(name);
    auto done = std::make_shared<std::promise<void>>();
    finished_ = done->get_future().share();

    const std::string component = name_;
    thread_ = std::thread([component, body = std::move(body), done] {
        try {
            body();
        } catch (const std::exception& e) {
            logError(component, std::string("Worker terminated by exception: ") + e.what());
        }
        done->set_value();
    });
}

bool WorkerThread::done() const {
    return finished_.valid() && finished_.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

bool WorkerThread::wait(std::chrono::milliseconds timeout) const {
    if (!finished_.valid()) return true;
    return finished_.wait_for(timeout) == std::future_status::ready;
}

void WorkerThread::join(std::chrono::milliseconds progressInterval) {
    if (!thread_.joinable()) return;
    if (progressInterval.count() <= 0) progressInterval = std::chrono::milliseconds(1000);

    auto waited = std::chrono::milliseconds(0);
    while (!wait(progressInterval)) {
        waited += progressInterval;
        logWarn(name_, strCat("Still finishing after ", waited.count(), " ms"));
    }
    thread_.join();
}
