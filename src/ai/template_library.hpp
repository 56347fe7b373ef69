#pragma once
// =============================================================================
// TemplateLibrary - named reference images for correlation matching
// =============================================================================
// Populated once per active season; cleared and reloaded on season change.
// A later load under an existing name silently replaces the entry and bumps
// its version.
// =============================================================================
#include "ai/image.hpp"
#include "autopick_log.hpp"
#include "result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace autopick::ai {

struct Template {
    std::string name;
    std::string category;
    Image image;
    std::string source_path;
    int version = 1;
    uint32_t checksum = 0;

    // Precomputed statistics for the NCC path
    std::vector<float> zero_mean;   // pixel - channel mean, RGB interleaved
    double norm_sq = 0.0;           // sum of zero_mean^2

    int width() const { return image.w; }
    int height() const { return image.h; }
};

struct TemplateLibraryConfig {
    bool allow_png = true;
    bool allow_jpg = true;
    bool allow_bmp = true;
};

class TemplateLibrary {
public:
    explicit TemplateLibrary(log::Sink& sink, const TemplateLibraryConfig& cfg = {});

    // Every supported image in directory (non-recursive), name = file stem.
    // Unreadable files are skipped with a warning. Returns loaded count.
    int load(const std::string& directory, const std::string& category);

    autopick::Result<void> loadFile(const std::string& name, const std::string& path,
                                    const std::string& category);

    autopick::Result<void> registerImage(const std::string& name, const Image& image,
                                         const std::string& category,
                                         const std::string& source_path = "");

    const Template* get(const std::string& name) const;
    bool contains(const std::string& name) const { return map_.count(name) > 0; }
    std::vector<std::string> names() const;
    std::vector<std::string> namesInCategory(const std::string& category) const;
    const std::map<std::string, Template>& all() const { return map_; }

    bool remove(const std::string& name);
    void clear();
    size_t size() const { return map_.size(); }

    bool isSupportedFile(const std::string& path) const;

private:
    log::Sink& log_;
    TemplateLibraryConfig cfg_;
    std::map<std::string, Template> map_;   // ordered: deterministic matchAll
};

} // namespace autopick::ai
