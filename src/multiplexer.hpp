#pragma once

#include "log_record.hpp"
#include "record_filter.hpp"
#include "record_queue.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace logtap {

// Merge point for one subscription. Every tailer the subscription reads
// offers its records here from its own polling thread; the delivery loop
// drains them through next(). Cross-file order is arrival order.
class Multiplexer {
public:
    Multiplexer(uint64_t id, RecordFilter filter, size_t capacity);

    Multiplexer(const Multiplexer&) = delete;
    Multiplexer& operator=(const Multiplexer&) = delete;

    uint64_t id() const { return id_; }
    const RecordFilter& filter() const { return filter_; }

    // Called by tailers. Returns true if the record passed the filter and
    // was queued. Never blocks; a full queue loses its oldest record.
    bool offer(const RecordPtr& record);

    template<typename Rep, typename Period>
    std::optional<RecordPtr> next(std::chrono::duration<Rep, Period> timeout) {
        return queue_.pop_for(timeout);
    }

    void close() { queue_.close(); }
    bool closed() const { return queue_.closed(); }

    size_t pending() const { return queue_.size(); }
    uint64_t admitted() const { return queue_.pushed(); }
    uint64_t dropped() const { return queue_.dropped(); }
    uint64_t rejected() const { return rejected_; }

private:
    uint64_t id_;
    RecordFilter filter_;
    RecordQueue<RecordPtr> queue_;
    std::atomic<uint64_t> rejected_{0};
};

} // namespace logtap
