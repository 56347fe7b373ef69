#pragma once
// =============================================================================
// TemplateMatcher - normalized cross-correlation against the TemplateLibrary
// =============================================================================
// Zero-mean NCC over RGB (TM_CCOEFF_NORMED semantics); window sums come from
// summed-area tables so each position costs one pass over the template.
// Cost is O(templates x crop pixels x template pixels): callers feed small
// per-slot crops, never full-screen frames.
// =============================================================================
#include "ai/image.hpp"
#include "ai/template_library.hpp"
#include "autopick_log.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autopick::ai {

struct MatchResult {
    std::string template_name;
    int x = 0;              // top-left in source coordinates
    int y = 0;
    int width = 0;          // template size
    int height = 0;
    float score = 0.0f;     // [-1, 1]

    int centerX() const { return x + width / 2; }
    int centerY() const { return y + height / 2; }
};

struct MatcherConfig {
    float default_threshold = 0.80f;
    int max_results = 1024;     // per template per call, highest scores kept
};

class TemplateMatcher {
public:
    TemplateMatcher(const TemplateLibrary& library, log::Sink& sink,
                    const MatcherConfig& config = {});

    // Every location scoring >= threshold (threshold < 0 -> default), row-major.
    // Beyond max_results only the highest-scoring locations are returned.
    std::vector<MatchResult> match(const Image& source, const std::string& template_name,
                                   float threshold = -1.0f) const;

    // Only templates that produced at least one match. A non-empty
    // category_prefix restricts the search to templates whose category
    // starts with it.
    std::map<std::string, std::vector<MatchResult>> matchAll(
        const Image& source, float threshold = -1.0f,
        const std::string& category_prefix = "") const;

    // Highest-scoring match of one template
    std::optional<MatchResult> findBest(const Image& source, const std::string& template_name,
                                        float threshold = -1.0f) const;

    const MatcherConfig& config() const { return config_; }
    void setDefaultThreshold(float t) { config_.default_threshold = t; }

private:
    std::vector<MatchResult> matchTemplate(const Image& source, const Template& tpl,
                                           float threshold) const;

    const TemplateLibrary& library_;
    log::Sink& log_;
    MatcherConfig config_;
};

} // namespace autopick::ai
