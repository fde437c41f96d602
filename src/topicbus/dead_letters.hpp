#pragma once

#include <any>
#include <exception>
#include <mutex>
#include <string>
#include <vector>

namespace topicbus {

struct DeadLetter {
    std::exception_ptr error;
    std::any data;
    std::string reason;
};

/**
 * Bounded store of failed deliveries.
 *
 * Insertion never blocks: once the buffer is full new entries are dropped and
 * the entries already held are kept in arrival order.
 */
class DeadLetterBuffer {
public:
    explicit DeadLetterBuffer(size_t capacity);

    // Returns false when the entry was dropped.
    bool try_push(DeadLetter letter);

    std::vector<DeadLetter> snapshot() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool full() const;

private:
    size_t capacity_;

    mutable std::mutex mutex_;
    std::vector<DeadLetter> letters_;
};

} // namespace topicbus
