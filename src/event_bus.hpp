// =============================================================================
// AutoPick - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Decouples the recognition loop from whatever observes it (CLI, UI, tests).
// Usage:
//   EventBus bus(sink);
//   auto sub = bus.subscribe<CardPickedEvent>([](const auto& e) { ... });
//   bus.publish(CardPickedEvent{...});
// =============================================================================
#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "autopick_log.hpp"
#include "ai/card.hpp"
#include "ai/game_state.hpp"

namespace autopick {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Per-tick recognition output (wholesale card list)
struct CardsRecognizedEvent : Event {
    std::vector<ai::Card> cards;
    ai::GamePhase phase = ai::GamePhase::Unknown;
    uint64_t tick = 0;
};

struct PhaseChangeEvent : Event {
    ai::GamePhase old_phase = ai::GamePhase::Unknown;
    ai::GamePhase new_phase = ai::GamePhase::Unknown;
};

struct CardPickedEvent : Event {
    ai::Card card;
    int x = 0, y = 0;
    uint64_t session_picks = 0;
    uint64_t total_picks = 0;
};

struct PickFailedEvent : Event {
    ai::Card card;
    std::string reason;
};

// Controller lifecycle (ControllerState as int)
struct ControllerStateEvent : Event {
    int old_state = 0;
    int new_state = 0;
};

struct SeasonChangedEvent : Event {
    std::string old_season;
    std::string new_season;
    int templates_loaded = 0;
};

enum class CommandSource { Auto, User };

// Pointer command (automation -> pointer backend)
struct TapCommandEvent : Event {
    int x = 0, y = 0;
    CommandSource source = CommandSource::User;
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

    void release() { unsub_ = nullptr; } // detach: subscription lives as long as the bus

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================

class EventBus {
public:
    using HandlerId = uint64_t;

    explicit EventBus(log::Sink& sink) : log_(sink) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        APLOG_DEBUG(log_, "eventbus", "Subscribed handler %llu for %s",
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
                APLOG_ERROR(log_, "eventbus", "Handler %llu threw: %s",
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

    log::Sink& log_;
    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace autopick
