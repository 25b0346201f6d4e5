#pragma once

#include "multiplexer.hpp"
#include "source_registry.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace logtap {

struct BroadcasterOptions {
    size_t queue_capacity = 1000;
    std::chrono::milliseconds keepalive{15000};
    std::chrono::milliseconds wake_interval{200};   // how often an idle loop checks its peer
};

struct BroadcastStats {
    size_t active = 0;
    uint64_t opened = 0;
    uint64_t delivered = 0;
    uint64_t dropped = 0;

    nlohmann::json to_json() const {
        return {
            {"active", active},
            {"opened", opened},
            {"delivered", delivered},
            {"dropped", dropped}
        };
    }
};

// One live viewer. Holds a registry reference on each selected source
// until closed or destroyed.
class Subscription {
public:
    using CloseHook = std::function<void(const Subscription&)>;

    Subscription(SourceRegistry& registry, std::vector<std::string> sources,
                 std::shared_ptr<Multiplexer> multiplexer, CloseHook on_close = nullptr);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    uint64_t id() const { return multiplexer_->id(); }
    const std::vector<std::string>& sources() const { return sources_; }
    const RecordFilter& filter() const { return multiplexer_->filter(); }
    Multiplexer& multiplexer() { return *multiplexer_; }
    const Multiplexer& multiplexer() const { return *multiplexer_; }

    // Detaches from every tailer and discards pending records. Idempotent.
    void close();
    bool is_closed() const { return closed_; }

private:
    SourceRegistry& registry_;
    std::vector<std::string> sources_;
    std::shared_ptr<Multiplexer> multiplexer_;
    CloseHook on_close_;
    std::atomic<bool> closed_{false};
};

class StreamBroadcaster {
public:
    // Returns false once the peer can no longer be written to.
    using Writer = std::function<bool(const std::string& chunk)>;
    using PeerCheck = std::function<bool()>;

    explicit StreamBroadcaster(SourceRegistry& registry, BroadcasterOptions options = {});
    ~StreamBroadcaster();

    StreamBroadcaster(const StreamBroadcaster&) = delete;
    StreamBroadcaster& operator=(const StreamBroadcaster&) = delete;

    // Compiles the filter and resolves every file before attaching anything.
    // An empty `files` selects every file discovery currently lists.
    // Throws FilterError or SourceError; nothing is created on failure.
    std::shared_ptr<Subscription> subscribe(const std::vector<std::string>& files,
                                            const std::string& filter_expression);

    // Delivery loop for one subscription, run on the caller's thread. Returns
    // when the peer goes away or the broadcaster stops; the subscription is
    // closed on return.
    void serve(const std::shared_ptr<Subscription>& subscription,
               const Writer& write, const PeerCheck& peer_open = nullptr);

    void stop();
    bool is_running() const { return running_; }

    BroadcastStats stats() const;

    static std::string format_event(const LogRecord& record);
    static std::string format_comment(const std::string& text);

private:
    std::vector<std::shared_ptr<Subscription>> live_subscriptions() const;
    void retire(const Subscription& subscription);

    SourceRegistry& registry_;
    BroadcasterOptions options_;
    std::atomic<bool> running_{true};
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> opened_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> retired_drops_{0};

    mutable std::mutex live_mutex_;
    std::map<uint64_t, std::weak_ptr<Subscription>> live_;
};

} // namespace logtap
