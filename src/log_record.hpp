#pragma once

#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace logtap {

// Producers write free-form level strings ("INFO", "warning", ...).
// Severity is only used for display.
enum class Severity : int {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3,
    Unknown = 4
};

inline std::string severity_to_string(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
        case Severity::Debug: return "debug";
        default: return "unknown";
    }
}

inline Severity level_to_severity(const std::string& level) {
    std::string l;
    l.reserve(level.size());
    for (char c : level) {
        l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (l == "error" || l == "critical" || l == "fatal") return Severity::Error;
    if (l == "warning" || l == "warn") return Severity::Warning;
    if (l == "info") return Severity::Info;
    if (l == "debug" || l == "trace") return Severity::Debug;
    return Severity::Unknown;
}

// One decoded JSON line. The decoded object is kept as-is so that fields
// the producer adds beyond the standard set survive re-encoding.
class LogRecord {
public:
    LogRecord() : fields_(nlohmann::json::object()) {}

    // Throws std::invalid_argument if `j` is not a JSON object.
    static LogRecord from_json(nlohmann::json j, std::string source = "") {
        if (!j.is_object()) {
            throw std::invalid_argument("record is not a JSON object");
        }
        LogRecord record;
        record.fields_ = std::move(j);
        record.source_ = std::move(source);
        return record;
    }

    // Returns nullopt for anything that is not exactly one JSON object.
    // On failure `error` (if given) receives the parser message.
    static std::optional<LogRecord> parse_line(const std::string& line,
                                               const std::string& source = "",
                                               std::string* error = nullptr) {
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            if (error) *error = "invalid JSON";
            return std::nullopt;
        }
        if (!j.is_object()) {
            if (error) *error = std::string("expected object, got ") + j.type_name();
            return std::nullopt;
        }
        return from_json(std::move(j), source);
    }

    std::string ts() const { return string_field("ts"); }
    std::string level() const { return string_field("level"); }
    std::string component() const { return string_field("component"); }
    std::string event() const { return string_field("event"); }
    std::string host() const { return string_field("host"); }

    int64_t pid() const {
        auto it = fields_.find("pid");
        if (it != fields_.end() && it->is_number_integer()) return it->get<int64_t>();
        return 0;
    }

    const nlohmann::json& data() const {
        static const nlohmann::json empty = nlohmann::json::object();
        auto it = fields_.find("data");
        return (it != fields_.end()) ? *it : empty;
    }

    Severity severity() const { return level_to_severity(level()); }

    // Name of the file this record was read from; not part of the wire form.
    const std::string& source() const { return source_; }

    bool has_field(const std::string& key) const { return fields_.contains(key); }

    // Text used for equality filtering. Strings compare by content,
    // numbers and booleans by their JSON text. null, objects and arrays
    // have no text form. "source" falls back to the file name when the
    // record carries no field of that name.
    std::optional<std::string> field_text(const std::string& key) const {
        auto it = fields_.find(key);
        if (it == fields_.end()) {
            if (key == "source" && !source_.empty()) return source_;
            return std::nullopt;
        }
        return scalar_text(*it);
    }

    static std::optional<std::string> scalar_text(const nlohmann::json& v) {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number() || v.is_boolean()) return v.dump();
        return std::nullopt;
    }

    const nlohmann::json& to_json() const { return fields_; }

    std::string to_wire() const {
        return fields_.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

private:
    std::string string_field(const char* key) const {
        auto it = fields_.find(key);
        if (it != fields_.end() && it->is_string()) return it->get<std::string>();
        return "";
    }

    nlohmann::json fields_;
    std::string source_;
};

// Records are shared read-only between every subscription that admits them.
using RecordPtr = std::shared_ptr<const LogRecord>;

} // namespace logtap
