#pragma once
/**
 * Memeforge - Tracking queue
 *
 * One-way, fire-and-forget delivery of "meme was rendered" events. send()
 * never blocks on the handler and never reports failure to the caller; the
 * queue belongs to the process, so events outlive the request that sent them.
 */

#include "common.h"
#include <condition_variable>
#include <deque>

struct TrackEvent {
    string template_id;
    vector<string> lines;
    string referer;
    string url;
};

using TrackHandler = function<void(const TrackEvent&)>;

class TrackingQueue {
public:
    explicit TrackingQueue(TrackHandler handler, size_t max_pending = 10000);
    ~TrackingQueue();

    TrackingQueue(const TrackingQueue&) = delete;
    TrackingQueue& operator=(const TrackingQueue&) = delete;

    void send(TrackEvent event);

    // Drain queued events and join the worker. Safe to call twice.
    void stop();

    size_t pending() const;

private:
    void worker_loop();

    TrackHandler handler_;
    size_t max_pending_;

    mutable mutex queue_mutex_;
    std::condition_variable available_;
    std::deque<TrackEvent> queue_;
    bool stopping_ = false;
    thread worker_;
};

// Handler that stores the joined overlay text and meme URL via stat_record_text().
TrackHandler make_stats_track_handler();
