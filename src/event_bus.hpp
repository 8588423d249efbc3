// =============================================================================
// Mirador - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// The session controller reports to its observers (UI, logging) through it.
// Usage:
//   auto sub = mirador::bus().subscribe<SessionErrorEvent>([](const auto& e) { ... });
//   mirador::bus().publish(SessionErrorEvent{...});
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <string>
#include <cstdint>
#include <atomic>
#include <algorithm>
#include "mirador_log.hpp"
#include "result.hpp"
#include "speed_tracker.hpp"
#include "session/session_state.hpp"

namespace mirador {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Session lifecycle
struct SessionStateChangedEvent : Event {
    SessionState old_state = SessionState::Idle;
    SessionState new_state = SessionState::Idle;
};

// Unsolicited close (device disconnect, server exit). Published after teardown.
struct SessionClosedEvent : Event {
    std::string device_serial;
};

// Any failure surfaced to the user
struct SessionErrorEvent : Event {
    SessionError::Kind kind = SessionError::Kind::Protocol;
    std::string message;
};

// Server debug/info output, forwarded verbatim
struct ServerLogEvent : Event {
    enum class Level { Debug, Info };
    Level level = Level::Info;
    std::string message;
};

struct ClipboardChangedEvent : Event {
    std::string content;
};

// Result of encoder negotiation
struct EncoderSelectedEvent : Event {
    std::vector<std::string> available;
    std::string requested;       // empty when nothing was preferred
    std::string effective;
    bool substituted = false;    // requested encoder was not offered
};

struct StreamSizeChangedEvent : Event {
    int width = 0;
    int height = 0;
};

struct TransferProgressEvent : Event {
    enum class Phase { Download, Upload };
    Phase phase = Phase::Download;
    TransferProgress progress;
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: subscription lives forever

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        MLOG_DEBUG("eventbus", "Subscribed handler %llu for %s",
                   (unsigned long long)id, typeid(T).name());

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto key = std::type_index(typeid(T));
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                MLOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = std::type_index(typeid(T));
        auto it = handlers_.find(key);
        return it != handlers_.end() && !it->second.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

// Global event bus singleton
inline EventBus& bus() {
    static EventBus instance;
    return instance;
}

} // namespace mirador
