#include "stream_broadcaster.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <sstream>

namespace logtap {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

} // namespace

Subscription::Subscription(SourceRegistry& registry, std::vector<std::string> sources,
                           std::shared_ptr<Multiplexer> multiplexer, CloseHook on_close)
    : registry_(registry)
    , sources_(std::move(sources))
    , multiplexer_(std::move(multiplexer))
    , on_close_(std::move(on_close))
{
    registry_.acquire(sources_, multiplexer_);
}

Subscription::~Subscription() {
    close();
}

void Subscription::close() {
    if (closed_.exchange(true)) return;

    registry_.release(sources_, multiplexer_->id());
    multiplexer_->close();

    if (on_close_) {
        on_close_(*this);
    }
}

StreamBroadcaster::StreamBroadcaster(SourceRegistry& registry, BroadcasterOptions options)
    : registry_(registry)
    , options_(options)
{
}

StreamBroadcaster::~StreamBroadcaster() {
    stop();
}

std::shared_ptr<Subscription> StreamBroadcaster::subscribe(const std::vector<std::string>& files,
                                                           const std::string& filter_expression) {
    if (!running_) {
        throw std::runtime_error("broadcaster is shutting down");
    }

    RecordFilter filter = RecordFilter::compile(filter_expression);

    std::vector<std::string> selected;
    if (files.empty()) {
        selected = registry_.list_files();
        if (selected.empty()) {
            throw SourceError("no log files in " + registry_.log_dir().string());
        }
    } else {
        for (const auto& name : files) {
            if (std::find(selected.begin(), selected.end(), name) != selected.end()) continue;
            registry_.resolve(name);
            selected.push_back(name);
        }
    }

    uint64_t id = next_id_++;
    auto multiplexer = std::make_shared<Multiplexer>(id, std::move(filter), options_.queue_capacity);
    auto subscription = std::make_shared<Subscription>(registry_, selected, multiplexer,
        [this](const Subscription& s) { retire(s); });

    {
        std::lock_guard<std::mutex> lock(live_mutex_);
        live_[id] = subscription;
    }
    ++opened_;

    ServerLog::log("Stream", "Subscription " + std::to_string(id) + " opened: files=" + join(selected, ",") +
        (subscription->filter().empty() ? "" : " filter=" + subscription->filter().to_string()));

    return subscription;
}

void StreamBroadcaster::retire(const Subscription& subscription) {
    retired_drops_ += subscription.multiplexer().dropped();

    std::lock_guard<std::mutex> lock(live_mutex_);
    live_.erase(subscription.id());
}

void StreamBroadcaster::serve(const std::shared_ptr<Subscription>& subscription,
                              const Writer& write, const PeerCheck& peer_open) {
    if (!subscription) return;

    auto& multiplexer = subscription->multiplexer();
    std::string id = std::to_string(subscription->id());

    std::string hello = "subscribed " + id + " files=" + join(subscription->sources(), ",");
    if (!subscription->filter().empty()) {
        hello += " filter=" + subscription->filter().to_string();
    }

    uint64_t sent = 0;
    bool writable = write(format_comment(hello));
    auto last_write = std::chrono::steady_clock::now();

    while (writable && running_ && !multiplexer.closed()) {
        auto record = multiplexer.next(options_.wake_interval);
        auto now = std::chrono::steady_clock::now();

        if (record) {
            writable = write(format_event(**record));
            if (writable) {
                ++sent;
                ++delivered_;
                last_write = now;
            }
            continue;
        }

        if (peer_open && !peer_open()) break;

        if (now - last_write >= options_.keepalive) {
            writable = write(format_comment("ping"));
            last_write = now;
        }
    }

    uint64_t dropped = multiplexer.dropped();
    subscription->close();

    ServerLog::log("Stream", "Subscription " + id + " closed: delivered=" + std::to_string(sent) +
        " dropped=" + std::to_string(dropped));
}

std::vector<std::shared_ptr<Subscription>> StreamBroadcaster::live_subscriptions() const {
    std::vector<std::shared_ptr<Subscription>> result;
    std::lock_guard<std::mutex> lock(live_mutex_);
    for (const auto& [id, weak] : live_) {
        if (auto sub = weak.lock()) {
            result.push_back(std::move(sub));
        }
    }
    return result;
}

void StreamBroadcaster::stop() {
    if (!running_.exchange(false)) return;

    auto live = live_subscriptions();
    for (auto& sub : live) {
        sub->close();
    }
    if (!live.empty()) {
        ServerLog::log("Stream", "Closed " + std::to_string(live.size()) + " live subscriptions");
    }
}

BroadcastStats StreamBroadcaster::stats() const {
    BroadcastStats s;
    s.opened = opened_;
    s.delivered = delivered_;
    s.dropped = retired_drops_;

    auto live = live_subscriptions();
    s.active = live.size();
    for (const auto& sub : live) {
        s.dropped += sub->multiplexer().dropped();
    }
    return s;
}

std::string StreamBroadcaster::format_event(const LogRecord& record) {
    return "data: " + record.to_wire() + "\n\n";
}

std::string StreamBroadcaster::format_comment(const std::string& text) {
    std::string line = text;
    std::replace(line.begin(), line.end(), '\n', ' ');
    std::replace(line.begin(), line.end(), '\r', ' ');
    return ": " + line + "\n\n";
}

} // namespace logtap
