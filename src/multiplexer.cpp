#include "multiplexer.hpp"

namespace logtap {

Multiplexer::Multiplexer(uint64_t id, RecordFilter filter, size_t capacity)
    : id_(id)
    , filter_(std::move(filter))
    , queue_(capacity)
{
}

bool Multiplexer::offer(const RecordPtr& record) {
    if (!record) return false;

    if (!filter_.matches(*record)) {
        ++rejected_;
        return false;
    }

    return queue_.push(record);
}

} // namespace logtap
