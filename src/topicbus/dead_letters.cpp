#include "dead_letters.hpp"
#include <algorithm>

namespace topicbus {

DeadLetterBuffer::DeadLetterBuffer(size_t capacity)
    : capacity_(capacity) {
    letters_.reserve(std::min<size_t>(capacity_, 1024));
}

bool DeadLetterBuffer::try_push(DeadLetter letter) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (letters_.size() >= capacity_) {
        return false;
    }
    letters_.push_back(std::move(letter));
    return true;
}

std::vector<DeadLetter> DeadLetterBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return letters_;
}

size_t DeadLetterBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return letters_.size();
}

bool DeadLetterBuffer::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return letters_.size() >= capacity_;
}

} // namespace topicbus
