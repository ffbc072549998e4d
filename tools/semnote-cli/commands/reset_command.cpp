#include "reset_command.hpp"

namespace semnote::cli {

void ResetCommand::setup(CLI::App& app) {
    app.add_flag("-f,--force", force_, "Skip confirmation prompt");
}

int ResetCommand::execute(CommandContext& ctx) {
    auto options = make_store_options(ctx.config);
    options.rebuild_on_dimension_change = false;

    auto opened = store::DocumentStore::open(options, ctx.logger);

    // The store refuses to open after a dimension change; reopening with
    // rebuild_on_dimension_change performs the reset itself.
    if (!opened.ok() && opened.error().code() == ErrorCode::DIMENSION_MISMATCH) {
        std::cout << opened.error().message() << "\n";
        if (!force_ && !confirm("Reset the database?")) {
            std::cout << "Cancelled.\n";
            return SEMNOTE_EXIT_USER_ERROR;
        }
        options.rebuild_on_dimension_change = true;
        opened = store::DocumentStore::open(options, ctx.logger);
        if (!opened.ok()) {
            return report_error(opened.error());
        }
        std::cout << "Database reset\n";
        return SEMNOTE_EXIT_SUCCESS;
    }
    if (!opened.ok()) {
        return report_error(opened.error());
    }

    auto store = std::move(opened.value());
    embedding::EmbeddingClient client(nullptr, ctx.config.dimension);
    IndexManager manager(*store, client, Chunker(ctx.config.chunking), *ctx.logger);

    auto result = manager.reset_database(&ResetCommand::confirm, force_);
    if (!result.ok()) {
        if (result.error().code() == ErrorCode::CONFIRMATION_REQUIRED) {
            std::cout << "Cancelled.\n";
            return SEMNOTE_EXIT_USER_ERROR;
        }
        return report_error(result.error());
    }

    std::cout << "Database reset\n";
    return SEMNOTE_EXIT_SUCCESS;
}

bool ResetCommand::confirm(const std::string& prompt) {
    std::cout << prompt << " [y/N] ";
    std::string response;
    std::getline(std::cin, response);
    return response == "y" || response == "Y";
}

}  // namespace semnote::cli
