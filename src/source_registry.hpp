#pragma once

#include "file_tailer.hpp"
#include "multiplexer.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace logtap {

// Unknown, ill-formed or path-escaping source names.
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SourceInfo {
    std::string name;
    size_t subscribers = 0;
    TailerStatus tailer;

    nlohmann::json to_json() const {
        auto j = tailer.to_json();
        j["subscribers"] = subscribers;
        return j;
    }
};

// Owns every FileTailer. Tailers are created on first reference and
// destroyed when the last subscription referencing them lets go.
class SourceRegistry {
public:
    static constexpr const char* kExtension = ".jsonl";

    explicit SourceRegistry(const std::filesystem::path& log_dir, TailerOptions options = {});
    ~SourceRegistry();

    SourceRegistry(const SourceRegistry&) = delete;
    SourceRegistry& operator=(const SourceRegistry&) = delete;

    // Discovery: names of the *.jsonl regular files in the log directory, sorted.
    std::vector<std::string> list_files() const;

    // Maps a requested name to its path. Throws SourceError for names that
    // could leave the log directory and for files that do not exist.
    std::filesystem::path resolve(const std::string& name) const;

    // Adds one reference per name and attaches `listener` to each tailer,
    // all under one lock. Names must already be resolved. If a tailer fails
    // to start, references taken by this call are released before the
    // exception propagates.
    void acquire(const std::vector<std::string>& names, const std::shared_ptr<Multiplexer>& listener);
    void release(const std::vector<std::string>& names, uint64_t listener_id);

    std::vector<SourceInfo> list_sources() const;
    size_t active_count() const;
    size_t references(const std::string& name) const;

    void stop_all();

    const std::filesystem::path& log_dir() const { return log_dir_; }

private:
    struct Entry {
        std::unique_ptr<FileTailer> tailer;
        size_t refs = 0;
    };

    static void check_name(const std::string& name);
    void release_locked(const std::string& name, uint64_t listener_id);

    std::filesystem::path log_dir_;
    TailerOptions options_;
    std::map<std::string, Entry> tailers_;
    mutable std::mutex mutex_;
};

} // namespace logtap
