// =============================================================================
// TemplateMatcher - SAT-based zero-mean NCC on the CPU
// =============================================================================
#include "ai/template_matcher.hpp"

#include <algorithm>
#include <cmath>

static constexpr const char* TAG = "matcher";

namespace autopick::ai {

namespace {

// Per-channel summed-area tables of I and I^2, (w+1) x (h+1)
struct SummedArea {
    int stride = 0;
    std::vector<double> s[3];
    std::vector<double> ss[3];

    explicit SummedArea(const Image& img) : stride(img.w + 1) {
        const size_t size = (size_t)(img.w + 1) * (img.h + 1);
        for (int c = 0; c < 3; ++c) {
            s[c].assign(size, 0.0);
            ss[c].assign(size, 0.0);
        }
        for (int y = 0; y < img.h; ++y) {
            double row_s[3] = {0.0, 0.0, 0.0};
            double row_ss[3] = {0.0, 0.0, 0.0};
            for (int x = 0; x < img.w; ++x) {
                const uint8_t* p = img.at(x, y);
                const size_t here = (size_t)(y + 1) * stride + (x + 1);
                const size_t above = (size_t)y * stride + (x + 1);
                for (int c = 0; c < 3; ++c) {
                    row_s[c] += p[c];
                    row_ss[c] += (double)p[c] * p[c];
                    s[c][here] = s[c][above] + row_s[c];
                    ss[c][here] = ss[c][above] + row_ss[c];
                }
            }
        }
    }

    double rect(const std::vector<double>& t, int x, int y, int w, int h) const {
        const size_t x0 = (size_t)x, y0 = (size_t)y;
        const size_t x1 = x0 + w, y1 = y0 + h;
        return t[y1 * stride + x1] - t[y0 * stride + x1] - t[y1 * stride + x0] + t[y0 * stride + x0];
    }
};

constexpr double kDenomEps = 1e-6;

} // namespace

TemplateMatcher::TemplateMatcher(const TemplateLibrary& library, log::Sink& sink,
                                 const MatcherConfig& config)
    : library_(library), log_(sink), config_(config) {}

std::vector<MatchResult> TemplateMatcher::match(const Image& source,
                                                const std::string& template_name,
                                                float threshold) const {
    if (source.empty()) return {};

    const Template* tpl = library_.get(template_name);
    if (!tpl) {
        APLOG_WARN(log_, TAG, "template not loaded: %s", template_name.c_str());
        return {};
    }
    if (threshold < 0.0f) threshold = config_.default_threshold;
    return matchTemplate(source, *tpl, threshold);
}

std::map<std::string, std::vector<MatchResult>> TemplateMatcher::matchAll(
    const Image& source, float threshold, const std::string& category_prefix) const {
    std::map<std::string, std::vector<MatchResult>> results;
    if (source.empty()) return results;
    if (threshold < 0.0f) threshold = config_.default_threshold;

    for (const auto& kv : library_.all()) {
        const Template& tpl = kv.second;
        if (!category_prefix.empty() &&
            tpl.category.compare(0, category_prefix.size(), category_prefix) != 0) {
            continue;
        }
        auto matches = matchTemplate(source, tpl, threshold);
        if (!matches.empty()) results.emplace(kv.first, std::move(matches));
    }
    return results;
}

std::optional<MatchResult> TemplateMatcher::findBest(const Image& source,
                                                     const std::string& template_name,
                                                     float threshold) const {
    auto matches = match(source, template_name, threshold);
    if (matches.empty()) return std::nullopt;
    return *std::max_element(matches.begin(), matches.end(),
                             [](const MatchResult& a, const MatchResult& b) {
                                 return a.score < b.score;
                             });
}

std::vector<MatchResult> TemplateMatcher::matchTemplate(const Image& source,
                                                        const Template& tpl,
                                                        float threshold) const {
    std::vector<MatchResult> out;
    const int tw = tpl.width();
    const int th = tpl.height();
    if (tw <= 0 || th <= 0 || tw > source.w || th > source.h) return out;
    if (tpl.norm_sq <= kDenomEps) return out;   // flat template correlates with nothing

    const SummedArea sat(source);
    const double n = (double)tw * th;
    const int search_w = source.w - tw + 1;
    const int search_h = source.h - th + 1;

    for (int y = 0; y < search_h; ++y) {
        for (int x = 0; x < search_w; ++x) {
            double window_var = 0.0;
            for (int c = 0; c < 3; ++c) {
                double s = sat.rect(sat.s[c], x, y, tw, th);
                double ss = sat.rect(sat.ss[c], x, y, tw, th);
                window_var += ss - s * s / n;
            }
            const double denom = std::sqrt(std::max(0.0, window_var) * tpl.norm_sq);
            if (denom <= kDenomEps) continue;

            // sum(T') == 0, so correlating with raw I equals correlating with I - mean(I)
            double num = 0.0;
            const float* t = tpl.zero_mean.data();
            for (int ty = 0; ty < th; ++ty) {
                const uint8_t* row = source.at(x, y + ty);
                const float* trow = t + (size_t)ty * tw * 3;
                for (int k = 0; k < tw * 3; ++k) num += (double)trow[k] * row[k];
            }

            float score = (float)std::clamp(num / denom, -1.0, 1.0);
            if (score < threshold) continue;

            MatchResult m;
            m.template_name = tpl.name;
            m.x = x;
            m.y = y;
            m.width = tw;
            m.height = th;
            m.score = score;
            out.push_back(std::move(m));
        }
    }

    // Cap after the full scan so the strongest locations survive
    if (config_.max_results > 0 && (int)out.size() > config_.max_results) {
        APLOG_DEBUG(log_, TAG, "%s: %zu matches capped to %d",
                    tpl.name.c_str(), out.size(), config_.max_results);
        auto by_score = [](const MatchResult& a, const MatchResult& b) {
            return a.score > b.score;
        };
        std::partial_sort(out.begin(), out.begin() + config_.max_results, out.end(), by_score);
        out.resize(config_.max_results);
        std::sort(out.begin(), out.end(), [](const MatchResult& a, const MatchResult& b) {
            return a.y != b.y ? a.y < b.y : a.x < b.x;
        });
    }

    if (!out.empty()) {
        APLOG_TRACE(log_, TAG, "%s: %zu match(es)", tpl.name.c_str(), out.size());
    }
    return out;
}

} // namespace autopick::ai
