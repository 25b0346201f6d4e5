#include "record_filter.hpp"
#include <sstream>

namespace logtap {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

RecordFilter RecordFilter::compile(const std::string& expression) {
    std::string trimmed = trim(expression);
    if (trimmed.empty()) {
        return RecordFilter();
    }
    if (trimmed.front() == '{') {
        return compile_json(trimmed);
    }
    return compile_pairs(trimmed);
}

RecordFilter RecordFilter::compile_pairs(const std::string& expression) {
    RecordFilter filter;

    std::stringstream ss(expression);
    std::string segment;
    while (std::getline(ss, segment, ',')) {
        std::string pair = trim(segment);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            throw FilterError("filter term '" + pair + "' is missing '='");
        }

        FieldConstraint c;
        c.field = trim(pair.substr(0, eq));
        c.expected = trim(pair.substr(eq + 1));
        if (c.field.empty()) {
            throw FilterError("filter term '" + pair + "' has an empty key");
        }
        filter.constraints_.push_back(std::move(c));
    }

    return filter;
}

RecordFilter RecordFilter::compile_json(const std::string& expression) {
    auto j = nlohmann::json::parse(expression, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw FilterError("filter is not a valid JSON object");
    }

    RecordFilter filter;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key().empty()) {
            throw FilterError("filter has an empty key");
        }
        auto text = LogRecord::scalar_text(it.value());
        if (!text) {
            throw FilterError("filter value for '" + it.key() + "' must be a string, number or boolean");
        }
        filter.constraints_.push_back({it.key(), *text});
    }
    return filter;
}

bool RecordFilter::matches(const LogRecord& record) const {
    for (const auto& c : constraints_) {
        auto actual = record.field_text(c.field);
        if (!actual || *actual != c.expected) {
            return false;
        }
    }
    return true;
}

std::string RecordFilter::to_string() const {
    std::string out;
    for (const auto& c : constraints_) {
        if (!out.empty()) out += ",";
        out += c.field + "=" + c.expected;
    }
    return out;
}

} // namespace logtap
