/**
 * Memeforge - Tracking queue implementation
 */

#include "tracking.h"
#include "stats.h"

TrackingQueue::TrackingQueue(TrackHandler handler, size_t max_pending)
    : handler_(std::move(handler)), max_pending_(max_pending) {
    worker_ = thread([this]() { worker_loop(); });
}

TrackingQueue::~TrackingQueue() {
    stop();
}

void TrackingQueue::send(TrackEvent event) {
    {
        lock_guard<mutex> lock(queue_mutex_);
        if (stopping_) return;
        if (queue_.size() >= max_pending_) {
            // Shed the oldest event rather than grow without bound
            queue_.pop_front();
        }
        queue_.push_back(std::move(event));
    }
    available_.notify_one();
}

void TrackingQueue::stop() {
    {
        lock_guard<mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    available_.notify_all();
    if (worker_.joinable()) worker_.join();
}

size_t TrackingQueue::pending() const {
    lock_guard<mutex> lock(queue_mutex_);
    return queue_.size();
}

void TrackingQueue::worker_loop() {
    while (true) {
        TrackEvent event;
        {
            std::unique_lock<mutex> lock(queue_mutex_);
            available_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;   // stopping and drained
            event = std::move(queue_.front());
            queue_.pop_front();
        }

        if (!handler_) continue;
        try {
            handler_(event);
        } catch (const std::exception& e) {
            cerr << "[Memeforge] Tracking failed for " << event.template_id << ": " << e.what() << endl;
        }
    }
}

TrackHandler make_stats_track_handler() {
    return [](const TrackEvent& event) {
        string text;
        for (const auto& line : event.lines) {
            if (line.empty()) continue;
            if (!text.empty()) text += ' ';
            text += line;
        }
        stat_record_text(event.template_id, text, event.referer, event.url);
    };
}
