#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

enum class ModelCategory { StableDiffusion, Lora, Vae, Embedding };

struct CategoryFolders {
    std::vector<std::filesystem::path> roots; // scanned for inventory and folder listings
    std::filesystem::path download_root;      // where new downloads for this category land
};

// Category roots supplied by the host. Read-only once handed to PathResolver.
class ModelRegistry {
public:
    void set(ModelCategory category, CategoryFolders folders);
    const CategoryFolders* find(ModelCategory category) const;
    std::vector<std::filesystem::path> all_roots() const;

private:
    std::map<ModelCategory, CategoryFolders> folders_;
};

// Conventional layout: <root>/Stable-Diffusion, <root>/Lora, <root>/VAE, <root>/Embeddings.
ModelRegistry registry_from_models_root(const std::filesystem::path& root);

// Points one category at a single directory, made absolute and normalized. Empty dir is a no-op.
void override_category_root(ModelRegistry& registry, ModelCategory category, const std::filesystem::path& dir);

// Accepts checkpoint(s), stable-diffusion, stable_diffusion, lora, vae(s), embedding(s), emb.
// Throws std::invalid_argument("Unsupported model category.") otherwise.
ModelCategory parse_category(const std::string& kind);

bool is_model_file(const std::filesystem::path& p);
bool is_safe_segment(const std::string& segment);

class PathResolver {
public:
    explicit PathResolver(ModelRegistry registry);

    // Maps "models/<category>/<sub...>" or "embeddings/<sub...>" to an absolute directory inside the
    // category's download root. Purely lexical: never touches the disk.
    // Throws std::invalid_argument with a user-facing message on any rejection.
    std::filesystem::path resolve(const std::string& target_path) const;

    // Relative sub-directories ("a/b") under every root of the category, sorted, dot-folders skipped.
    std::vector<std::string> list_subfolders(const std::string& kind) const;

    std::vector<std::filesystem::path> model_roots() const { return registry_.all_roots(); }

private:
    const CategoryFolders& folders_for(ModelCategory category) const;

    ModelRegistry registry_;
};

// True when child equals base or lies beneath it, compared component by component.
bool path_within(const std::filesystem::path& base, const std::filesystem::path& child);
