#include <semnote/config.hpp>

#include <cerrno>
#include <cstdlib>

namespace semnote {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return value;
    }
    return nullptr;
}

Result<int> parse_positive_int(const std::string& text, const std::string& what) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);

    if (end == text.c_str() || *end != '\0' || errno == ERANGE ||
        value <= 0 || value > 1'000'000) {
        return Error(ErrorCode::INVALID_ARGUMENT,
            what + " must be a positive integer, got '" + text + "'");
    }
    return static_cast<int>(value);
}

}  // namespace

Config default_config() {
    Config config;

    const char* home = std::getenv("HOME");
    if (home) {
        config.database_path = fs::path(home) / ".semnote" / "index.db";
        config.notes_directory = fs::path(home) / "notes";
    } else {
        config.database_path = fs::path(".semnote") / "index.db";
        config.notes_directory = "notes";
    }
    return config;
}

Result<void> apply_env_overrides(Config& config) {
    Config updated = config;

    if (const char* db = env("SEMNOTE_DB")) {
        updated.database_path = db;
    }
    if (const char* notes = env("SEMNOTE_NOTES_DIR")) {
        updated.notes_directory = notes;
    }
    if (const char* dim = env("SEMNOTE_DIMENSION")) {
        auto parsed = parse_positive_int(dim, "SEMNOTE_DIMENSION");
        if (!parsed.ok()) return parsed.error();
        updated.dimension = parsed.value();
    }
    if (const char* chunking = env("SEMNOTE_CHUNKING")) {
        auto parsed = parse_chunk_policy(chunking);
        if (!parsed.ok()) return parsed.error();
        updated.chunking = parsed.value();
    }
    if (const char* url = env("SEMNOTE_OLLAMA_URL")) {
        updated.embedder.base_url = url;
    }
    if (const char* model = env("SEMNOTE_EMBED_MODEL")) {
        updated.embedder.model = model;
    }

    config = std::move(updated);
    return {};
}

Result<void> validate(const Config& config) {
    if (config.database_path.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Database path is required");
    }
    if (config.dimension <= 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Embedding dimension must be positive");
    }
    if (config.max_concurrent_embeds == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "max_concurrent_embeds must be at least 1");
    }
    if (config.note_extensions.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "At least one note extension is required");
    }
    return {};
}

store::StoreOptions make_store_options(const Config& config) {
    store::StoreOptions options;
    options.database_path = config.database_path.string();
    options.index = config.index;
    options.index.dimension = config.dimension;
    options.rebuild_on_dimension_change = config.rebuild_on_dimension_change;
    return options;
}

}  // namespace semnote
