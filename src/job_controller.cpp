#include "job_controller.hpp"

#include "queue_reporter.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace nsp_split {

JobController::JobController(std::shared_ptr<EventQueue> queue, SplitHooks hooks)
    : events_(queue ? std::move(queue) : std::make_shared<EventQueue>()), hooks_(std::move(hooks)) {}

JobController::~JobController() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool JobController::start(const SplitRequest& request) {
    if (running_.load(std::memory_order_acquire)) {
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    running_.store(true, std::memory_order_relaxed);
    worker_ = std::jthread([this, request](std::stop_token stop_token) {
        run_worker(std::move(stop_token), request);
    });
    return true;
}

void JobController::cancel() {
    worker_.request_stop();
}

bool JobController::is_running() const {
    return running_.load(std::memory_order_acquire);
}

std::vector<ProgressEvent> JobController::poll_events() {
    auto events = events_->pop_all();
    const bool saw_terminal = std::any_of(events.begin(), events.end(), [](const ProgressEvent& e) {
        return is_terminal(e);
    });

    if (saw_terminal) {
        if (worker_.joinable()) {
            worker_.join();
        }
        running_.store(false, std::memory_order_relaxed);
    }

    return events;
}

void JobController::run_worker(std::stop_token stop_token, SplitRequest request) {
    request.stop_token = std::move(stop_token);
    QueueReporter reporter(*events_);

    try {
        split_file(request, reporter, hooks_);
        events_->push(NormalExitEvent{});
    } catch (const SplitError& ex) {
        events_->push(ExceptionExitEvent{ex.kind(), ex.what(), describe(ex)});
    } catch (const std::exception& ex) {
        events_->push(ExceptionExitEvent{
            SplitErrorKind::Unexpected,
            ex.what(),
            describe(SplitErrorKind::Unexpected, ex.what())
        });
    } catch (...) {
        events_->push(ExceptionExitEvent{
            SplitErrorKind::Unexpected,
            "unknown error",
            describe(SplitErrorKind::Unexpected, "unknown error")
        });
    }

    // The terminal event is queued; a consumer draining the queue directly
    // must still be able to start the next run.
    running_.store(false, std::memory_order_release);
}

}  // namespace nsp_split
