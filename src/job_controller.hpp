#pragma once

#include "event_queue.hpp"
#include "split_engine.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace nsp_split {

// Runs split_file() on a worker thread and hands its events to a polling
// consumer through an EventQueue. Each run ends with exactly one terminal
// event (NormalExitEvent or ExceptionExitEvent).
class JobController {
public:
    explicit JobController(std::shared_ptr<EventQueue> queue = nullptr, SplitHooks hooks = {});
    ~JobController();

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    bool start(const SplitRequest& request);
    void cancel();

    bool is_running() const;

    // Never blocks on the worker's I/O. Joins the worker once the drained
    // batch contains its terminal event. is_running() turns false as soon as
    // the worker has queued that event, whoever drains it.
    std::vector<ProgressEvent> poll_events();

    const std::shared_ptr<EventQueue>& queue() const { return events_; }

private:
    void run_worker(std::stop_token stop_token, SplitRequest request);

    std::shared_ptr<EventQueue> events_;
    SplitHooks hooks_;
    std::atomic<bool> running_{false};
    std::jthread worker_;
};

}  // namespace nsp_split
