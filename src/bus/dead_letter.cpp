#include "esflow/bus/dead_letter.hpp"

namespace esflow {

const char* to_string(DeadLetterReason reason) noexcept {
    switch (reason) {
        case DeadLetterReason::HandlerError: return "HANDLER_ERROR";
        case DeadLetterReason::MaxRetriesExceeded: return "MAX_RETRIES_EXCEEDED";
    }
    return "UNKNOWN";
}

void DeadLetterQueue::record(DeadLetter letter) {
    std::lock_guard<std::mutex> lock(mutex_);
    letters_.push_back(std::move(letter));
}

std::vector<DeadLetter> DeadLetterQueue::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return letters_;
}

std::vector<DeadLetter> DeadLetterQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeadLetter> out;
    out.swap(letters_);
    return out;
}

std::size_t DeadLetterQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return letters_.size();
}

} // namespace esflow
