#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <thread>
#include "capabilities.hpp"
#include "config.hpp"

// Fire-and-forget delivery of notifications on a worker thread. post() never
// blocks on the transport; when the queue is full the oldest entry is dropped.
class NotifyDispatcher {
public:
    NotifyDispatcher(Notifier& notifier,
                     size_t max_queue = cfg::NOTIFY_QUEUE_MAX,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(cfg::NOTIFY_TIMEOUT_MS));
    ~NotifyDispatcher();

    NotifyDispatcher(const NotifyDispatcher&) = delete;
    NotifyDispatcher& operator=(const NotifyDispatcher&) = delete;

    void start();
    void stop();   // delivers what is still queued, then joins

    void post(Notification n);

    // Waits until the queue is empty and nothing is being sent.
    bool wait_idle(std::chrono::milliseconds timeout);

    size_t dropped() const;
    size_t failed() const;

private:
    void worker_fn();

    Notifier& notifier_;
    size_t max_queue_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Notification> queue_;
    bool running_ = false;
    bool sending_ = false;
    size_t dropped_ = 0;
    size_t failed_ = 0;
    std::thread th_;
};

// Default transport: writes notifications to the log. Push services plug in
// behind the same Notifier interface.
class LogNotifier : public Notifier {
public:
    bool send(const Notification& n, std::chrono::milliseconds timeout, std::string& err) override;
};
