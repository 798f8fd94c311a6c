#pragma once

#include "progress_event.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace nsp_split {

// Unbounded FIFO shared between the splitting worker and a polling consumer.
// None of the operations wait on the other side.
class EventQueue {
public:
    void push(ProgressEvent event);
    std::optional<ProgressEvent> try_pop();
    std::vector<ProgressEvent> pop_all();

private:
    std::mutex mutex_;
    std::deque<ProgressEvent> events_;
};

}  // namespace nsp_split
