#include "commands/command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/index_command.hpp"
#include "commands/reindex_command.hpp"
#include "commands/reset_command.hpp"
#include "commands/search_command.hpp"
#include "commands/stats_command.hpp"

#include <semnote/semnote.hpp>
#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace semnote;
using namespace semnote::cli;

namespace {

// Command-line values layered on top of defaults and environment
struct GlobalOptions {
    std::string database;
    std::string notes_dir;
    int dimension = 0;
    std::string chunking;
    std::string ollama_url;
    std::string model;
    bool verbose = false;
};

Result<void> apply_global_options(const GlobalOptions& opts, Config& config) {
    if (!opts.database.empty()) config.database_path = opts.database;
    if (!opts.notes_dir.empty()) config.notes_directory = opts.notes_dir;
    if (opts.dimension != 0) config.dimension = opts.dimension;
    if (!opts.ollama_url.empty()) config.embedder.base_url = opts.ollama_url;
    if (!opts.model.empty()) config.embedder.model = opts.model;
    if (opts.verbose) config.verbose = true;

    if (!opts.chunking.empty()) {
        auto policy = parse_chunk_policy(opts.chunking);
        if (!policy.ok()) {
            return policy.error();
        }
        config.chunking = policy.value();
    }

    return validate(config);
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"semnote - semantic search over your notes"};
    app.require_subcommand(1);

    GlobalOptions opts;
    app.add_option("--db", opts.database, "Index database path (default: ~/.semnote/index.db)")
        ->type_name("<path>");
    app.add_option("--notes-dir", opts.notes_dir, "Notes directory (default: ~/notes)")
        ->type_name("<path>");
    app.add_option("--dimension", opts.dimension, "Embedding dimension (default: 768)")
        ->type_name("<n>")
        ->check(CLI::PositiveNumber);
    app.add_option("--chunking", opts.chunking, "Chunking policy: whole or paragraph")
        ->type_name("<policy>");
    app.add_option("--ollama-url", opts.ollama_url, "Ollama server URL")
        ->type_name("<url>");
    app.add_option("--model", opts.model, "Embedding model name")
        ->type_name("<name>");
    app.add_flag("-v,--verbose", opts.verbose, "Verbose logging");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<IndexCommand>());
    commands.push_back(std::make_unique<ReindexCommand>());
    commands.push_back(std::make_unique<SearchCommand>());
    commands.push_back(std::make_unique<ResetCommand>());
    commands.push_back(std::make_unique<StatsCommand>());

    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& cmd : commands) {
        CLI::App* sub = app.add_subcommand(cmd->name(), cmd->description());
        cmd->setup(*sub);
        registered.emplace_back(sub, cmd.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? SEMNOTE_EXIT_SUCCESS : SEMNOTE_EXIT_USER_ERROR;
    }

    Config config = default_config();
    auto env = apply_env_overrides(config);
    if (!env.ok()) {
        return report_error(env.error());
    }
    auto applied = apply_global_options(opts, config);
    if (!applied.ok()) {
        return report_error(applied.error());
    }

    ConsoleLogger logger("semnote");
    logger.set_min_level(config.verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    CommandContext ctx;
    ctx.config = config;
    ctx.logger = &logger;

    for (auto& [sub, cmd] : registered) {
        if (sub->parsed()) {
            return cmd->execute(ctx);
        }
    }

    std::cerr << app.help();
    return SEMNOTE_EXIT_USER_ERROR;
}
