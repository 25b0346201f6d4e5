#pragma once

#include "log_record.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace logtap {

class FilterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct FieldConstraint {
    std::string field;
    std::string expected;
};

// Conjunction of top-level field equality checks, compiled once per
// subscription. An empty filter matches everything.
class RecordFilter {
public:
    RecordFilter() = default;

    // Accepts "k=v,k=v" or a JSON object {"k": "v"}. Throws FilterError.
    // In the pair form ASCII whitespace around keys and values is trimmed,
    // so "component= x" compares against "x". Use the JSON form to match a
    // value with leading or trailing spaces.
    static RecordFilter compile(const std::string& expression);

    bool matches(const LogRecord& record) const;

    bool empty() const { return constraints_.empty(); }
    const std::vector<FieldConstraint>& constraints() const { return constraints_; }

    // Canonical "k=v,k=v" form.
    std::string to_string() const;

private:
    static RecordFilter compile_pairs(const std::string& expression);
    static RecordFilter compile_json(const std::string& expression);

    std::vector<FieldConstraint> constraints_;
};

} // namespace logtap
