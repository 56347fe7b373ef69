// =============================================================================
// TemplateLibrary - directory scan + stb_image load + NCC precompute
// =============================================================================
#include "ai/template_library.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

static constexpr const char* TAG = "TplLibrary";

namespace autopick::ai {

static uint32_t fnv1a32(const uint8_t* d, size_t n) {
    uint32_t h = 2166136261u;
    for (size_t i = 0; i < n; ++i) h = (h ^ d[i]) * 16777619u;
    return h;
}

static void precompute(Template& t) {
    const size_t n = t.image.pixelCount();
    double sum[3] = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < n; ++i) {
        for (int c = 0; c < 3; ++c) sum[c] += t.image.pix[i * 3 + c];
    }
    double mean[3];
    for (int c = 0; c < 3; ++c) mean[c] = n ? sum[c] / (double)n : 0.0;

    t.zero_mean.resize(n * 3);
    t.norm_sq = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (int c = 0; c < 3; ++c) {
            double v = t.image.pix[i * 3 + c] - mean[c];
            t.zero_mean[i * 3 + c] = (float)v;
            t.norm_sq += v * v;
        }
    }
}

TemplateLibrary::TemplateLibrary(log::Sink& sink, const TemplateLibraryConfig& cfg)
    : log_(sink), cfg_(cfg) {}

bool TemplateLibrary::isSupportedFile(const std::string& path) const {
    auto ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (ext == ".png") return cfg_.allow_png;
    if (ext == ".jpg" || ext == ".jpeg") return cfg_.allow_jpg;
    if (ext == ".bmp") return cfg_.allow_bmp;
    return false;
}

int TemplateLibrary::load(const std::string& directory, const std::string& category) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        APLOG_ERROR(log_, TAG, "template directory not found: %s", directory.c_str());
        return 0;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        if (isSupportedFile(it->path().string())) files.push_back(it->path());
    }
    if (ec) {
        APLOG_WARN(log_, TAG, "directory scan stopped early: %s (%s)",
                   directory.c_str(), ec.message().c_str());
    }
    std::sort(files.begin(), files.end());

    int loaded = 0;
    for (const auto& p : files) {
        auto r = loadFile(p.stem().string(), p.string(), category);
        if (r.is_ok()) {
            ++loaded;
        } else {
            APLOG_WARN(log_, TAG, "skipping template %s: %s",
                       p.string().c_str(), r.error().message.c_str());
        }
    }

    APLOG_INFO(log_, TAG, "loaded %d template(s) from %s [%s]",
               loaded, directory.c_str(), category.c_str());
    return loaded;
}

autopick::Result<void> TemplateLibrary::loadFile(const std::string& name,
                                                 const std::string& path,
                                                 const std::string& category) {
    if (name.empty()) {
        return autopick::Err<void>("empty template name", ErrorCode::InvalidArgument);
    }
    auto img = loadImageFile(path);
    if (img.is_err()) {
        return autopick::Err<void>(img.error().message, ErrorCode::Configuration);
    }
    return registerImage(name, img.value(), category, path);
}

autopick::Result<void> TemplateLibrary::registerImage(const std::string& name,
                                                      const Image& image,
                                                      const std::string& category,
                                                      const std::string& source_path) {
    if (name.empty()) {
        return autopick::Err<void>("empty template name", ErrorCode::InvalidArgument);
    }
    if (image.empty() || image.pix.size() != image.pixelCount() * 3) {
        return autopick::Err<void>("invalid template image: " + name,
                                   ErrorCode::InvalidArgument);
    }

    Template t;
    t.name = name;
    t.category = category;
    t.image = image;
    t.source_path = source_path;
    t.checksum = fnv1a32(image.pix.data(), image.pix.size());
    precompute(t);

    auto it = map_.find(name);
    if (it != map_.end()) {
        t.version = it->second.version + 1;
        APLOG_DEBUG(log_, TAG, "template replaced: %s v%d", name.c_str(), t.version);
    }
    map_[name] = std::move(t);

    APLOG_DEBUG(log_, TAG, "template registered: %s %dx%d [%s]",
                name.c_str(), image.w, image.h, category.c_str());
    return autopick::Ok();
}

const Template* TemplateLibrary::get(const std::string& name) const {
    auto it = map_.find(name);
    if (it == map_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> TemplateLibrary::names() const {
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    return out;
}

std::vector<std::string> TemplateLibrary::namesInCategory(const std::string& category) const {
    std::vector<std::string> out;
    for (const auto& kv : map_) {
        if (kv.second.category == category) out.push_back(kv.first);
    }
    return out;
}

bool TemplateLibrary::remove(const std::string& name) {
    if (map_.erase(name) == 0) return false;
    APLOG_INFO(log_, TAG, "template removed: %s", name.c_str());
    return true;
}

void TemplateLibrary::clear() {
    map_.clear();
    APLOG_INFO(log_, TAG, "all templates cleared");
}

} // namespace autopick::ai
