#include "event_queue.hpp"

#include <iterator>
#include <utility>

namespace nsp_split {

void EventQueue::push(ProgressEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
}

std::optional<ProgressEvent> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent front = std::move(events_.front());
    events_.pop_front();
    return front;
}

std::vector<ProgressEvent> EventQueue::pop_all() {
    std::deque<ProgressEvent> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(events_);
    }
    return std::vector<ProgressEvent>(
        std::make_move_iterator(drained.begin()),
        std::make_move_iterator(drained.end())
    );
}

}  // namespace nsp_split
