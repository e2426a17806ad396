#include "notify.hpp"
#include "utils.hpp"
#include <utility>

NotifyDispatcher::NotifyDispatcher(Notifier& notifier, size_t max_queue,
                                   std::chrono::milliseconds timeout)
    : notifier_(notifier), max_queue_(max_queue == 0 ? 1 : max_queue), timeout_(timeout) {}

NotifyDispatcher::~NotifyDispatcher() {
    stop();
}

void NotifyDispatcher::start() {
    std::lock_guard<std::mutex> lk(m_);
    if (running_) return;
    running_ = true;
    th_ = std::thread(&NotifyDispatcher::worker_fn, this);
}

void NotifyDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        running_ = false;
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
}

void NotifyDispatcher::post(Notification n) {
    {
        std::lock_guard<std::mutex> lk(m_);
        // Keep the queue short; drop oldest if necessary
        if (queue_.size() >= max_queue_) {
            log_warn("notify: queue full, dropping \"%s\"", queue_.front().title.c_str());
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(std::move(n));
    }
    cv_.notify_one();
}

bool NotifyDispatcher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    return idle_cv_.wait_for(lk, timeout, [&] { return queue_.empty() && !sending_; });
}

size_t NotifyDispatcher::dropped() const {
    std::lock_guard<std::mutex> lk(m_);
    return dropped_;
}

size_t NotifyDispatcher::failed() const {
    std::lock_guard<std::mutex> lk(m_);
    return failed_;
}

void NotifyDispatcher::worker_fn() {
    while (true) {
        Notification n;
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [&] { return !running_ || !queue_.empty(); });

            if (!running_ && queue_.empty())
                break;

            n = std::move(queue_.front());
            queue_.pop_front();
            sending_ = true;
        }

        std::string err;
        bool ok = notifier_.send(n, timeout_, err);
        if (!ok) log_warn("notify: \"%s\" not delivered: %s", n.title.c_str(), err.c_str());

        {
            std::lock_guard<std::mutex> lk(m_);
            sending_ = false;
            if (!ok) failed_++;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

bool LogNotifier::send(const Notification& n, std::chrono::milliseconds, std::string&) {
    std::string msg = n.message;
    for (auto& c : msg) if (c == '\n') c = ' ';
    if (n.attachment.empty())
        log_info("[%s] %s", n.title.c_str(), msg.c_str());
    else
        log_info("[%s] %s (attachment %zu bytes)", n.title.c_str(), msg.c_str(), n.attachment.size());
    return true;
}
