#include "source_registry.hpp"
#include <algorithm>

namespace logtap {

namespace fs = std::filesystem;

SourceRegistry::SourceRegistry(const fs::path& log_dir, TailerOptions options)
    : log_dir_(log_dir)
    , options_(options)
{
}

SourceRegistry::~SourceRegistry() {
    stop_all();
}

void SourceRegistry::check_name(const std::string& name) {
    if (name.empty()) {
        throw SourceError("empty source name");
    }
    if (name == "." || name == ".." ||
        name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos ||
        name.find('\0') != std::string::npos) {
        throw SourceError("source name '" + name + "' is outside the log directory");
    }
    const std::string ext = kExtension;
    if (name.size() <= ext.size() || name.compare(name.size() - ext.size(), ext.size(), ext) != 0) {
        throw SourceError("source name '" + name + "' is not a " + ext + " file");
    }
}

std::vector<std::string> SourceRegistry::list_files() const {
    std::vector<std::string> files;

    std::error_code ec;
    if (!fs::is_directory(log_dir_, ec)) {
        return files;
    }

    for (fs::directory_iterator it(log_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        std::string name = it->path().filename().string();
        if (it->path().extension() == kExtension && name.size() > std::string(kExtension).size()) {
            files.push_back(std::move(name));
        }
    }
    if (ec) {
        ServerLog::error("Sources", "Failed to list " + log_dir_.string() + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

fs::path SourceRegistry::resolve(const std::string& name) const {
    check_name(name);

    fs::path path = log_dir_ / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw SourceError("unknown source '" + name + "'");
    }
    return path;
}

void SourceRegistry::acquire(const std::vector<std::string>& names, const std::shared_ptr<Multiplexer>& listener) {
    for (const auto& name : names) {
        check_name(name);
    }
    uint64_t listener_id = listener ? listener->id() : 0;

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> attached;
    try {
        for (const auto& name : names) {
            auto it = tailers_.find(name);
            if (it == tailers_.end()) {
                auto tailer = std::make_unique<FileTailer>((log_dir_ / name).string(), name, options_);
                tailer->start();
                it = tailers_.emplace(name, Entry{std::move(tailer), 0}).first;
            }
            it->second.tailer->attach(listener);
            ++it->second.refs;
            attached.push_back(name);
        }
    } catch (...) {
        // All or nothing: undo the names already taken, then report
        for (const auto& name : attached) {
            release_locked(name, listener_id);
        }
        throw;
    }
}

void SourceRegistry::release(const std::vector<std::string>& names, uint64_t listener_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& name : names) {
        release_locked(name, listener_id);
    }
}

void SourceRegistry::release_locked(const std::string& name, uint64_t listener_id) {
    auto it = tailers_.find(name);
    if (it == tailers_.end()) return;

    it->second.tailer->detach(listener_id);
    if (it->second.refs > 0) {
        --it->second.refs;
    }
    if (it->second.refs == 0) {
        it->second.tailer->stop();
        tailers_.erase(it);
    }
}

std::vector<SourceInfo> SourceRegistry::list_sources() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SourceInfo> result;
    for (const auto& [name, entry] : tailers_) {
        SourceInfo info;
        info.name = name;
        info.subscribers = entry.refs;
        info.tailer = entry.tailer->status();
        result.push_back(info);
    }
    return result;
}

size_t SourceRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tailers_.size();
}

size_t SourceRegistry::references(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tailers_.find(name);
    return it == tailers_.end() ? 0 : it->second.refs;
}

void SourceRegistry::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& [name, entry] : tailers_) {
        entry.tailer->stop();
    }
    tailers_.clear();
}

} // namespace logtap
