#pragma once

#include "exit_codes.hpp"

#include <semnote/semnote.hpp>
#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace semnote::cli {

/**
 * Context passed to command execution.
 * Holds the resolved configuration and the shared logger.
 */
struct CommandContext {
    Config config;
    Logger* logger = nullptr;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with configuration and logger
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Print an error to stderr and map it to an exit code.
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Open the document store. Prints error to stderr on failure.
 */
inline std::unique_ptr<store::DocumentStore> open_store(CommandContext& ctx) {
    auto result = store::DocumentStore::open(make_store_options(ctx.config), ctx.logger);
    if (!result.ok()) {
        report_error(result.error());
        return nullptr;
    }
    return std::move(result.value());
}

/**
 * Create the embedding client for the configured provider.
 * Prints error to stderr on failure.
 */
inline std::unique_ptr<embedding::EmbeddingClient> create_embedding_client(CommandContext& ctx) {
    auto embedder = embedding::EmbedderFactory::create(ctx.config.embedder);
    if (!embedder.ok()) {
        report_error(embedder.error());
        return nullptr;
    }

    int reported = embedder.value()->dimension();
    if (reported != 0 && reported != ctx.config.dimension) {
        std::cerr << "Error: model '" << ctx.config.embedder.model << "' produces "
                  << reported << "-dimensional embeddings but dimension "
                  << ctx.config.dimension << " is configured (use --dimension)\n";
        return nullptr;
    }

    return std::make_unique<embedding::EmbeddingClient>(embedder.value(), ctx.config.dimension);
}

/**
 * Truncate a string for display, adding "..." if needed.
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

/**
 * First non-blank line of a document, for result listings.
 */
inline std::string preview(const std::string& text, size_t max_len = 72) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find('\n', start);
    std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
    return truncate(line, max_len);
}

}  // namespace semnote::cli
