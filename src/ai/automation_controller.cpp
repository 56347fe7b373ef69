#include "ai/automation_controller.hpp"
#include "event_bus.hpp"

#include <algorithm>

static constexpr const char* TAG = "controller";

namespace autopick::ai {

using std::chrono::milliseconds;
using std::chrono::steady_clock;

const char* controllerStateName(ControllerState s) {
    switch (s) {
        case ControllerState::Stopped: return "STOPPED";
        case ControllerState::Running: return "RUNNING";
        case ControllerState::Paused:  return "PAUSED";
    }
    return "UNKNOWN";
}

static milliseconds clampInterval(milliseconds d) {
    return std::max(d, milliseconds(ControllerConfig::kMinIntervalMs));
}

AutomationController::AutomationController(CardRecognizer& recognizer,
                                           StrategyManager& strategies,
                                           Actuator& actuator, log::Sink& sink,
                                           EventBus* bus, const ControllerConfig& cfg)
    : recognizer_(recognizer), strategies_(strategies), actuator_(actuator),
      log_(sink), bus_(bus),
      detect_interval_(clampInterval(milliseconds(cfg.detect_interval_ms))),
      cooldown_(clampInterval(milliseconds(cfg.pick_cooldown_ms))),
      stop_timeout_(milliseconds(std::max(0, cfg.stop_timeout_ms))),
      pause_poll_(clampInterval(milliseconds(cfg.pause_poll_ms))) {
    stats_strategy_id_ = strategies_.activeId();
}

AutomationController::~AutomationController() {
    stop();
    if (thread_.joinable()) thread_.join();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool AutomationController::start() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state() != ControllerState::Stopped) {
            APLOG_WARN(log_, TAG, "start ignored: already %s", controllerStateName(state()));
            return false;
        }

        joinFinishedLoop();

        token_ = CancellationToken();
        session_picks_ = 0;

        std::promise<void> exited;
        loop_exited_ = exited.get_future();
        setState(ControllerState::Running);
        thread_ = std::thread(&AutomationController::loop, this, token_, std::move(exited));

        APLOG_INFO(log_, TAG, "started (interval=%lldms cooldown=%lldms strategy=%s)",
                   (long long)detect_interval_.count(), (long long)cooldown_.count(),
                   strategies_.activeId().c_str());
    }
    publishState(ControllerState::Stopped, ControllerState::Running);
    return true;
}

bool AutomationController::stop() {
    ControllerState old;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        old = state();
        if (old == ControllerState::Stopped) return false;

        token_.cancel();
        {
            std::lock_guard<std::mutex> wl(wake_mutex_);
        }
        wake_cv_.notify_all();

        if (loop_exited_.valid() &&
            loop_exited_.wait_for(stop_timeout_) == std::future_status::ready) {
            if (thread_.joinable()) thread_.join();
        } else {
            APLOG_WARN(log_, TAG, "loop did not exit within %lldms, joining later",
                       (long long)stop_timeout_.count());
        }

        setState(ControllerState::Stopped);
        APLOG_INFO(log_, TAG, "stopped (session picks=%llu)",
                   (unsigned long long)session_picks_.load());
    }
    publishState(old, ControllerState::Stopped);
    return true;
}

bool AutomationController::pause() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state() != ControllerState::Running) return false;
        setState(ControllerState::Paused);
    }
    publishState(ControllerState::Running, ControllerState::Paused);
    return true;
}

bool AutomationController::resume() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state() != ControllerState::Paused) return false;
        {
            std::lock_guard<std::mutex> wl(wake_mutex_);
            setState(ControllerState::Running);
        }
        wake_cv_.notify_all();
    }
    publishState(ControllerState::Paused, ControllerState::Running);
    return true;
}

void AutomationController::setState(ControllerState s) {
    ControllerState old = state_.exchange(s);
    if (old == s) return;
    APLOG_DEBUG(log_, TAG, "state %s -> %s", controllerStateName(old), controllerStateName(s));
}

// Called without lifecycle_mutex_ held
void AutomationController::publishState(ControllerState old_state, ControllerState new_state) {
    if (!bus_) return;
    ControllerStateEvent evt;
    evt.old_state = (int)old_state;
    evt.new_state = (int)new_state;
    bus_->publish(evt);
}

// A loop left behind by a timed-out stop() has been cancelled; reap it here
void AutomationController::joinFinishedLoop() {
    if (!thread_.joinable()) return;
    APLOG_DEBUG(log_, TAG, "joining previous loop thread");
    thread_.join();
}

// =============================================================================
// Loop
// =============================================================================

void AutomationController::loop(CancellationToken token, std::promise<void> exited) {
    APLOG_DEBUG(log_, TAG, "loop thread started");
    try {
        while (!token.cancelled()) {
            if (state() == ControllerState::Paused) {
                sleepFor(pause_poll_, token, true);
                continue;
            }
            tick(steady_clock::now());
            sleepFor(detect_interval_, token);
        }
    } catch (const std::exception& e) {
        APLOG_ERROR(log_, TAG, "loop terminated: %s", e.what());
    }
    APLOG_DEBUG(log_, TAG, "loop thread exiting");
    exited.set_value();
}

// until_resumed: also wake as soon as the state leaves Paused
void AutomationController::sleepFor(milliseconds d, const CancellationToken& token,
                                    bool until_resumed) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, d, [&] {
        return token.cancelled() ||
               (until_resumed && state() != ControllerState::Paused);
    });
}

TickReport AutomationController::tick(steady_clock::time_point now) {
    TickReport report;
    report.tick = ++ticks_;

    try {
        applyPending();

        auto recognized = recognizer_.refreshAndRecognize(now);
        if (recognized.is_err()) {
            APLOG_WARN(log_, TAG, "tick %llu skipped: %s",
                       (unsigned long long)report.tick, recognized.error().message.c_str());
            report.error = recognized.error().message;
        } else {
            const std::vector<Card>& cards = recognized.value();
            report.recognized = true;
            report.card_count = cards.size();

            if (bus_) {
                CardsRecognizedEvent evt;
                evt.cards = cards;
                evt.phase = recognizer_.gameState().phase;
                evt.tick = report.tick;
                bus_->publish(evt);
            }

            report.chosen = strategies_.select(cards, recognizer_.gameState());
            if (report.chosen) {
                if (last_pick_ && now - *last_pick_ < cooldown_) {
                    report.cooldown_blocked = true;
                    APLOG_TRACE(log_, TAG, "cooldown: %s deferred", report.chosen->name.c_str());
                } else {
                    const Card& card = *report.chosen;
                    auto pos = recognizer_.cardPosition(card);
                    if (pos.first == 0 && pos.second == 0) {
                        failPick(card, 0, 0, "no card position");
                    } else if (actuator_.pick(pos.first, pos.second)) {
                        last_pick_ = now;
                        ++total_picks_;
                        ++session_picks_;
                        markSelected(card);
                        report.dispatched = true;
                        APLOG_INFO(log_, TAG, "picked %s at (%d, %d)",
                                   card.fullName().c_str(), pos.first, pos.second);
                        if (bus_) {
                            CardPickedEvent evt;
                            evt.card = card;
                            evt.card.select();
                            evt.x = pos.first;
                            evt.y = pos.second;
                            evt.session_picks = session_picks_.load();
                            evt.total_picks = total_picks_.load();
                            bus_->publish(evt);
                        }
                    } else {
                        failPick(card, pos.first, pos.second, "actuator rejected the click");
                    }
                }
            }
        }
    } catch (const std::exception& e) {
        APLOG_ERROR(log_, TAG, "tick %llu failed: %s", (unsigned long long)report.tick, e.what());
        report.error = e.what();
    } catch (...) {
        APLOG_ERROR(log_, TAG, "tick %llu failed: unknown exception",
                    (unsigned long long)report.tick);
        report.error = "unknown exception";
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_strategy_id_ = strategies_.activeId();
        stats_phase_ = recognizer_.gameState().phase;
        stats_recognized_ = recognizer_.gameState().cards.size();
    }
    return report;
}

// Not counted as a pick; the cooldown clock is left alone
void AutomationController::failPick(const Card& card, int x, int y, const char* reason) {
    ++failed_picks_;
    APLOG_WARN(log_, TAG, "pick failed: %s at (%d, %d): %s", card.name.c_str(), x, y, reason);
    if (bus_) {
        PickFailedEvent evt;
        evt.card = card;
        evt.reason = reason;
        bus_->publish(evt);
    }
}

void AutomationController::markSelected(const Card& card) {
    for (auto& c : recognizer_.gameState().cards) {
        if (c == card) {
            c.select();
            return;
        }
    }
}

// =============================================================================
// Configuration
// =============================================================================

void AutomationController::enqueue(std::function<void()> cmd) {
    std::lock_guard<std::mutex> lock(cmd_mutex_);
    pending_.push_back(std::move(cmd));
}

void AutomationController::applyPending() {
    std::vector<std::function<void()>> cmds;
    {
        std::lock_guard<std::mutex> lock(cmd_mutex_);
        cmds.swap(pending_);
    }
    for (auto& cmd : cmds) cmd();
}

void AutomationController::setDetectInterval(milliseconds interval) {
    milliseconds d = clampInterval(interval);
    enqueue([this, d] {
        detect_interval_ = d;
        APLOG_INFO(log_, TAG, "detect interval: %lldms", (long long)d.count());
    });
}

void AutomationController::setCooldown(milliseconds cooldown) {
    milliseconds d = clampInterval(cooldown);
    enqueue([this, d] {
        cooldown_ = d;
        APLOG_INFO(log_, TAG, "pick cooldown: %lldms", (long long)d.count());
    });
}

bool AutomationController::setStrategy(const std::string& id) {
    if (!strategies_.find(id)) {
        APLOG_ERROR(log_, TAG, "unknown strategy: %s", id.c_str());
        return false;
    }
    enqueue([this, id] { strategies_.setActive(id); });
    return true;
}

void AutomationController::setPriorityList(std::vector<std::string> list) {
    enqueue([this, list = std::move(list)] {
        PriorityStrategy* p = strategies_.as<PriorityStrategy>(strategies_.activeId());
        if (!p) p = strategies_.firstOf<PriorityStrategy>();
        if (!p) {
            APLOG_WARN(log_, TAG, "no priority strategy registered");
            return;
        }
        p->setPriorityList(list);
        APLOG_INFO(log_, TAG, "priority list: %zu card(s)", list.size());
    });
}

void AutomationController::setCostWeights(std::map<int, float> weights) {
    enqueue([this, weights = std::move(weights)] {
        CostWeightedStrategy* s = strategies_.as<CostWeightedStrategy>(strategies_.activeId());
        if (!s) s = strategies_.firstOf<CostWeightedStrategy>();
        if (!s) {
            APLOG_WARN(log_, TAG, "no cost-weighted strategy registered");
            return;
        }
        s->setCostWeights(weights);
    });
}

void AutomationController::setTargetComposition(std::set<std::string> names) {
    enqueue([this, names = std::move(names)] {
        TargetCompositionStrategy* s =
            strategies_.as<TargetCompositionStrategy>(strategies_.activeId());
        if (!s) s = strategies_.firstOf<TargetCompositionStrategy>();
        if (!s) {
            APLOG_WARN(log_, TAG, "no target-composition strategy registered");
            return;
        }
        s->setTargetComposition(names);
        APLOG_INFO(log_, TAG, "target composition: %zu card(s)", names.size());
    });
}

void AutomationController::setDecks(std::map<std::string, std::vector<std::string>> decks) {
    std::lock_guard<std::mutex> lock(cmd_mutex_);
    decks_ = std::move(decks);
}

bool AutomationController::useDeck(const std::string& name) {
    std::set<std::string> names;
    {
        std::lock_guard<std::mutex> lock(cmd_mutex_);
        auto it = decks_.find(name);
        if (it == decks_.end()) {
            APLOG_ERROR(log_, TAG, "unknown deck: %s", name.c_str());
            return false;
        }
        names.insert(it->second.begin(), it->second.end());
    }
    setTargetComposition(std::move(names));
    APLOG_INFO(log_, TAG, "deck selected: %s", name.c_str());
    return true;
}

void AutomationController::resetStatistics() {
    enqueue([this] {
        session_picks_ = 0;
        failed_picks_ = 0;
        last_pick_.reset();
    });
}

void AutomationController::setSeason(const std::string& season) {
    enqueue([this, season] {
        if (season == recognizer_.season()) return;
        recognizer_.setSeason(season);
    });
}

void AutomationController::setShopRegions(std::vector<Rect> regions) {
    enqueue([this, regions = std::move(regions)] {
        recognizer_.setShopRegions(regions);
        APLOG_INFO(log_, TAG, "shop regions: %zu slot(s)", regions.size());
    });
}

void AutomationController::setCardCatalog(std::map<std::string, std::set<std::string>> catalog) {
    enqueue([this, catalog = std::move(catalog)] { recognizer_.setCardCatalog(catalog); });
}

void AutomationController::setSlotThreshold(float threshold) {
    enqueue([this, threshold] { recognizer_.setSlotThreshold(threshold); });
}

ControllerStatistics AutomationController::statistics() const {
    ControllerStatistics s;
    s.total_picks = total_picks_.load();
    s.session_picks = session_picks_.load();
    s.failed_picks = failed_picks_.load();
    s.ticks = ticks_.load();
    s.state = state();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    s.strategy_id = stats_strategy_id_;
    s.phase = stats_phase_;
    s.recognized_count = stats_recognized_;
    return s;
}

} // namespace autopick::ai
