#pragma once
// =============================================================================
// AutomationController - detect -> select -> act loop
// =============================================================================
// Stopped -> Running (start) -> Paused (pause) -> Running (resume) -> Stopped
//
// One background thread runs tick() for the whole Running/Paused lifetime and
// is the only writer of GameState and the pick counters. Lifecycle calls flip
// polled flags; configuration setters queue commands that the loop applies at
// the top of the next tick. stop() waits at most stop_timeout for the loop.
// ControllerStateEvent is published after the lifecycle lock is released, so
// handlers may call start/stop/pause/resume.
// =============================================================================
#include "ai/actuator.hpp"
#include "ai/card.hpp"
#include "ai/card_recognizer.hpp"
#include "ai/game_state.hpp"
#include "ai/strategy.hpp"
#include "autopick_log.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace autopick {
class EventBus;
}

namespace autopick::ai {

enum class ControllerState { Stopped, Running, Paused };

const char* controllerStateName(ControllerState s);

// Copies share one flag
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct ControllerConfig {
    static constexpr int kMinIntervalMs = 100;

    int detect_interval_ms = 300;
    int pick_cooldown_ms = 500;
    int stop_timeout_ms = 2000;
    int pause_poll_ms = 100;
};

struct ControllerStatistics {
    uint64_t total_picks = 0;
    uint64_t session_picks = 0;
    uint64_t failed_picks = 0;
    uint64_t ticks = 0;
    ControllerState state = ControllerState::Stopped;
    std::string strategy_id;
    GamePhase phase = GamePhase::Unknown;
    size_t recognized_count = 0;
};

// Outcome of one tick
struct TickReport {
    uint64_t tick = 0;
    bool recognized = false;         // capture + recognition succeeded
    size_t card_count = 0;
    std::optional<Card> chosen;
    bool dispatched = false;         // actuator accepted the pick
    bool cooldown_blocked = false;
    std::string error;               // non-empty when the tick failed
};

class AutomationController {
public:
    AutomationController(CardRecognizer& recognizer, StrategyManager& strategies,
                         Actuator& actuator, log::Sink& sink,
                         EventBus* bus = nullptr, const ControllerConfig& cfg = {});
    ~AutomationController();

    AutomationController(const AutomationController&) = delete;
    AutomationController& operator=(const AutomationController&) = delete;

    // ---- lifecycle (false on misuse, never throws) ----
    bool start();
    bool stop();
    bool pause();
    bool resume();

    ControllerState state() const { return state_.load(); }
    bool isRunning() const { return state() != ControllerState::Stopped; }

    // ---- configuration (applied at the top of the next tick) ----
    void setDetectInterval(std::chrono::milliseconds interval);
    void setCooldown(std::chrono::milliseconds cooldown);
    bool setStrategy(const std::string& id);
    void setPriorityList(std::vector<std::string> list);
    void setCostWeights(std::map<int, float> weights);
    void setTargetComposition(std::set<std::string> names);
    void setDecks(std::map<std::string, std::vector<std::string>> decks);
    bool useDeck(const std::string& name);
    void resetStatistics();

    // Recognizer configuration, applied by the loop between ticks
    void setSeason(const std::string& season);
    void setShopRegions(std::vector<Rect> regions);
    void setCardCatalog(std::map<std::string, std::set<std::string>> catalog);
    void setSlotThreshold(float threshold);

    ControllerStatistics statistics() const;

    // One detect -> select -> act cycle. Called by the loop; callable directly
    // while Stopped.
    TickReport tick(std::chrono::steady_clock::time_point now =
                        std::chrono::steady_clock::now());

private:
    void loop(CancellationToken token, std::promise<void> exited);
    void sleepFor(std::chrono::milliseconds d, const CancellationToken& token,
                  bool until_resumed = false);
    void applyPending();
    void enqueue(std::function<void()> cmd);
    void setState(ControllerState s);
    void publishState(ControllerState old_state, ControllerState new_state);
    void failPick(const Card& card, int x, int y, const char* reason);
    void markSelected(const Card& card);
    void joinFinishedLoop();

    CardRecognizer& recognizer_;
    StrategyManager& strategies_;
    Actuator& actuator_;
    log::Sink& log_;
    EventBus* bus_;

    // loop-thread only
    std::chrono::milliseconds detect_interval_;
    std::chrono::milliseconds cooldown_;
    std::chrono::milliseconds stop_timeout_;
    std::chrono::milliseconds pause_poll_;
    std::optional<std::chrono::steady_clock::time_point> last_pick_;

    std::atomic<ControllerState> state_{ControllerState::Stopped};
    std::atomic<uint64_t> total_picks_{0};
    std::atomic<uint64_t> session_picks_{0};
    std::atomic<uint64_t> failed_picks_{0};
    std::atomic<uint64_t> ticks_{0};

    std::mutex lifecycle_mutex_;
    std::thread thread_;
    std::future<void> loop_exited_;
    CancellationToken token_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::mutex cmd_mutex_;
    std::vector<std::function<void()>> pending_;
    std::map<std::string, std::vector<std::string>> decks_;

    mutable std::mutex stats_mutex_;
    std::string stats_strategy_id_;
    GamePhase stats_phase_ = GamePhase::Unknown;
    size_t stats_recognized_ = 0;
};

} // namespace autopick::ai
