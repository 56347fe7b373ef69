// =============================================================================
// autopick - replay a still frame through detect -> select -> act
// =============================================================================
// Usage:
//   autopick --config <json> --frame <image> [--ticks N | --seconds S]
//            [--capture name:cost:x,y,w,h] [--verbose]
// With automation.auto_start and neither --ticks nor --seconds, the loop runs
// until SIGINT / SIGTERM.
// =============================================================================
#include "ai/actuator.hpp"
#include "ai/automation_controller.hpp"
#include "ai/card_recognizer.hpp"
#include "ai/screen_source.hpp"
#include "ai/strategy.hpp"
#include "ai/template_capture.hpp"
#include "ai/template_library.hpp"
#include "ai/template_matcher.hpp"
#include "autopick_log.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace autopick;

static constexpr const char* TAG = "main";

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

struct CliOptions {
    std::string config_path = "autopick.json";
    std::string frame_path;
    int ticks = 1;
    bool ticks_given = false;
    double seconds = 0.0;
    std::vector<std::string> captures;
    bool verbose = false;
};

void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s --config <json> --frame <image> [--ticks N | --seconds S]\n"
        "          [--capture name:cost:x,y,w,h] [--verbose]\n", prog);
}

bool parseArgs(int argc, char* argv[], CliOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        auto next = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "%s needs a value\n", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(a, "--config") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.config_path = v;
        } else if (std::strcmp(a, "--frame") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.frame_path = v;
        } else if (std::strcmp(a, "--ticks") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.ticks = std::atoi(v);
            opt.ticks_given = true;
        } else if (std::strcmp(a, "--seconds") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.seconds = std::atof(v);
        } else if (std::strcmp(a, "--capture") == 0) {
            const char* v = next(a);
            if (!v) return false;
            opt.captures.push_back(v);
        } else if (std::strcmp(a, "--verbose") == 0) {
            opt.verbose = true;
        } else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            return false;
        } else {
            std::fprintf(stderr, "unknown option: %s\n", a);
            return false;
        }
    }
    return !opt.frame_path.empty();
}

void printStatistics(const ai::ControllerStatistics& s) {
    std::printf("state:            %s\n", ai::controllerStateName(s.state));
    std::printf("strategy:         %s\n", s.strategy_id.c_str());
    std::printf("phase:            %s\n", ai::gamePhaseName(s.phase));
    std::printf("recognized cards: %zu\n", s.recognized_count);
    std::printf("ticks:            %llu\n", (unsigned long long)s.ticks);
    std::printf("session picks:    %llu\n", (unsigned long long)s.session_picks);
    std::printf("total picks:      %llu\n", (unsigned long long)s.total_picks);
    std::printf("failed picks:     %llu\n", (unsigned long long)s.failed_picks);
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage(argv[0]);
        return 2;
    }

    log::ConsoleSink sink;
    config::AppConfig cfg = config::loadConfig(opt.config_path, sink);

    sink.setLevel(opt.verbose ? log::Level::Debug : log::levelFromString(cfg.log.level));
    if (!cfg.log.log_path.empty() && !sink.openLogFile(cfg.log.log_path)) {
        APLOG_WARN(sink, TAG, "cannot open log file %s", cfg.log.log_path.c_str());
    }

    auto frame = ai::loadImageFile(opt.frame_path);
    if (frame.is_err()) {
        APLOG_ERROR(sink, TAG, "frame: %s", frame.error().message.c_str());
        return 1;
    }

    EventBus bus(sink);
    ai::FrameScreenSource screen(std::move(frame).value());

    ai::TemplateLibrary library(sink);
    ai::MatcherConfig mcfg;
    mcfg.default_threshold = cfg.recognition.matcher_threshold;
    ai::TemplateMatcher matcher(library, sink, mcfg);

    ai::CardRecognizer recognizer(screen, library, matcher, sink, &bus,
                                  config::toRecognizerConfig(cfg));
    recognizer.setCardCatalog(config::cardClasses(cfg, cfg.recognition.season));
    recognizer.loadSeasonTemplates();

    for (const auto& spec : opt.captures) {
        auto req = ai::parseCaptureSpec(spec);
        if (req.is_err()) {
            APLOG_ERROR(sink, TAG, "--capture %s: %s", spec.c_str(), req.error().message.c_str());
            return 2;
        }
        ai::TemplateCapture capture(screen, library, recognizer,
                                    cfg.recognition.templates_dir, sink);
        auto saved = capture.capture(req.value());
        if (saved.is_err()) {
            APLOG_ERROR(sink, TAG, "capture failed: %s", saved.error().message.c_str());
            return 1;
        }
    }

    ai::StrategyManager strategies(sink);
    if (auto* p = strategies.firstOf<ai::PriorityStrategy>()) {
        p->setMaxCost(cfg.strategy.max_cost);
        p->setPreferHigherCost(cfg.strategy.prefer_higher_cost);
    }

    auto tap_sub = bus.subscribe<TapCommandEvent>([&sink](const TapCommandEvent& e) {
        APLOG_INFO(sink, "tap", "tap (%d, %d)", e.x, e.y);
    });
    auto pick_sub = bus.subscribe<CardPickedEvent>([](const CardPickedEvent& e) {
        std::printf("picked %s at (%d, %d)\n", e.card.toString().c_str(), e.x, e.y);
    });

    ai::TapEventActuator actuator(bus, sink, config::toActuatorConfig(cfg));
    ai::AutomationController controller(recognizer, strategies, actuator, sink, &bus,
                                        config::toControllerConfig(cfg));

    controller.setDecks(cfg.strategy.decks);
    controller.setPriorityList(cfg.strategy.priority_list);
    controller.setCostWeights(cfg.strategy.cost_weights);
    controller.setTargetComposition({cfg.strategy.target_comp.begin(),
                                     cfg.strategy.target_comp.end()});
    if (!controller.setStrategy(cfg.strategy.active)) {
        APLOG_WARN(sink, TAG, "keeping strategy %s", strategies.activeId().c_str());
    }

    if (opt.seconds > 0.0) {
        controller.start();
        std::this_thread::sleep_for(std::chrono::duration<double>(opt.seconds));
        controller.stop();
    } else if (cfg.automation.auto_start && !opt.ticks_given) {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        APLOG_INFO(sink, TAG, "auto_start: running until interrupted");
        controller.start();
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        controller.stop();
    } else {
        // Ticks one cooldown apart so each may pick
        auto now = std::chrono::steady_clock::now();
        const auto step = std::chrono::milliseconds(cfg.automation.pick_cooldown_ms);
        for (int i = 0; i < opt.ticks; ++i) {
            ai::TickReport r = controller.tick(now);
            APLOG_DEBUG(sink, TAG, "tick %llu: %zu card(s)%s%s",
                        (unsigned long long)r.tick, r.card_count,
                        r.dispatched ? " picked" : "",
                        r.cooldown_blocked ? " cooldown" : "");
            now += step;
        }
    }

    printStatistics(controller.statistics());
    return 0;
}
