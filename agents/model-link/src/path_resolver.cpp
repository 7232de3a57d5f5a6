#include "../include/path_resolver.hpp"
#include "../include/text_util.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
const char* kModelExts[] = {".safetensors", ".ckpt", ".pt", ".sft", ".gguf"};
const char* kSafePunctuation = " _.,#@!$%^&()-+=";

// Decodes one UTF-8 sequence at s[i]; returns 0 and leaves i unchanged on malformed input.
static char32_t next_code_point(const std::string& s, size_t& i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char c = byte(i);
    size_t len = 0;
    char32_t cp = 0;
    if (c < 0x80) { len = 1; cp = c; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return 0;
    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    i += len;
    return cp;
}

static std::vector<std::string> split_segments(const std::string& normalized) {
    std::vector<std::string> parts;
    std::stringstream ss(normalized);
    std::string part;
    while (std::getline(ss, part, '/')) {
        part = trim(part);
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

static void ensure_safe_segment(const std::string& segment) {
    if (segment == "." || segment == "..") throw std::invalid_argument("Target path contains traversal segments.");
    if (!is_safe_segment(segment)) throw std::invalid_argument("Target path contains unsupported characters.");
}

static bool hidden_relative(const std::string& relative) {
    std::stringstream ss(relative);
    std::string seg;
    while (std::getline(ss, seg, '/')) {
        if (!seg.empty() && seg[0] == '.') return true;
    }
    return false;
}
}

void ModelRegistry::set(ModelCategory category, CategoryFolders folders) {
    folders_[category] = std::move(folders);
}

const CategoryFolders* ModelRegistry::find(ModelCategory category) const {
    auto it = folders_.find(category);
    return it == folders_.end() ? nullptr : &it->second;
}

std::vector<fs::path> ModelRegistry::all_roots() const {
    std::vector<fs::path> out;
    for (const auto& kv : folders_) {
        for (const auto& r : kv.second.roots) {
            if (!r.empty()) out.push_back(r);
        }
    }
    return out;
}

ModelRegistry registry_from_models_root(const fs::path& root) {
    ModelRegistry reg;
    auto add = [&](ModelCategory c, const char* sub) {
        fs::path dir = fs::absolute(root / sub).lexically_normal();
        reg.set(c, CategoryFolders{{dir}, dir});
    };
    add(ModelCategory::StableDiffusion, "Stable-Diffusion");
    add(ModelCategory::Lora, "Lora");
    add(ModelCategory::Vae, "VAE");
    add(ModelCategory::Embedding, "Embeddings");
    return reg;
}

void override_category_root(ModelRegistry& registry, ModelCategory category, const fs::path& dir) {
    if (dir.empty()) return;
    fs::path p = fs::absolute(dir).lexically_normal();
    registry.set(category, CategoryFolders{{p}, p});
}

ModelCategory parse_category(const std::string& kind) {
    std::string k = to_lower(trim(kind));
    if (k == "checkpoint" || k == "checkpoints" || k == "stable-diffusion" || k == "stable_diffusion") {
        return ModelCategory::StableDiffusion;
    }
    if (k == "lora") return ModelCategory::Lora;
    if (k == "vae" || k == "vaes") return ModelCategory::Vae;
    if (k == "embedding" || k == "embeddings" || k == "emb") return ModelCategory::Embedding;
    throw std::invalid_argument("Unsupported model category.");
}

bool is_model_file(const fs::path& p) {
    std::string ext = p.extension().string();
    for (const char* e : kModelExts) {
        if (iequals(ext, e)) return true;
    }
    return false;
}

bool is_safe_segment(const std::string& segment) {
    if (segment.empty()) return false;
    size_t i = 0;
    while (i < segment.size()) {
        unsigned char c = static_cast<unsigned char>(segment[i]);
        if (c < 0x80) {
            if (!std::isalnum(c) && !std::strchr(kSafePunctuation, c)) return false;
            ++i;
            continue;
        }
        char32_t cp = next_code_point(segment, i);
        if (cp < 0xA0 || cp > 0x24F) return false;
    }
    return true;
}

bool path_within(const fs::path& base, const fs::path& child) {
    fs::path b = base.lexically_normal();
    fs::path c = child.lexically_normal();
    // "/a/b/" normalizes with an empty last element
    if (!b.has_filename() && b.has_relative_path()) b = b.parent_path();
    if (!c.has_filename() && c.has_relative_path()) c = c.parent_path();
    auto ci = c.begin();
    for (auto bi = b.begin(); bi != b.end(); ++bi, ++ci) {
        if (ci == c.end() || *bi != *ci) return false;
    }
    return true;
}

PathResolver::PathResolver(ModelRegistry registry) : registry_(std::move(registry)) {}

const CategoryFolders& PathResolver::folders_for(ModelCategory category) const {
    const CategoryFolders* f = registry_.find(category);
    if (!f) throw std::invalid_argument("Model handler unavailable.");
    return *f;
}

fs::path PathResolver::resolve(const std::string& target_path) const {
    if (trim(target_path).empty()) throw std::invalid_argument("Target path is required.");

    std::string normalized = target_path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    normalized = trim(normalized);
    while (!normalized.empty() && normalized.front() == '/') normalized.erase(normalized.begin());
    while (!normalized.empty() && normalized.back() == '/') normalized.pop_back();
    if (normalized.empty() || normalized.rfind("../", 0) == 0) throw std::invalid_argument("Target path is invalid.");

    std::vector<std::string> parts = split_segments(normalized);
    if (parts.empty()) throw std::invalid_argument("Target path is invalid.");

    size_t offset = 0;
    ModelCategory category = ModelCategory::StableDiffusion;
    std::string first = to_lower(parts[0]);
    if (first == "embeddings" || first == "embedding") {
        category = ModelCategory::Embedding;
        offset = 1;
    } else if (first == "models") {
        if (parts.size() < 2) throw std::invalid_argument("Target path must include a model category.");
        category = parse_category(parts[1]);
        offset = 2;
    } else {
        throw std::invalid_argument("Target path must start with embeddings or models.");
    }

    const fs::path& root = folders_for(category).download_root;
    if (root.empty()) throw std::invalid_argument("Target path folder is unavailable.");

    fs::path base = fs::absolute(root).lexically_normal();
    fs::path combined = base;
    for (size_t i = offset; i < parts.size(); ++i) {
        ensure_safe_segment(parts[i]);
        combined /= parts[i];
    }
    fs::path full = combined.lexically_normal();
    if (!path_within(base, full)) throw std::invalid_argument("Target path escapes allowed directories.");
    return full;
}

std::vector<std::string> PathResolver::list_subfolders(const std::string& kind) const {
    const CategoryFolders& folders = folders_for(parse_category(kind));
    std::set<std::string, CaseInsensitiveLess> results;
    for (const auto& root : folders.roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) continue;
        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            if (!it->is_directory(ec)) continue;
            std::string relative = it->path().lexically_relative(root).generic_string();
            if (relative.empty() || relative == "." || hidden_relative(relative)) continue;
            results.insert(relative);
        }
    }
    return std::vector<std::string>(results.begin(), results.end());
}
