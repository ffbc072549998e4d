#include "search_command.hpp"
#include <iomanip>

namespace semnote::cli {

void SearchCommand::setup(CLI::App& app) {
    app.add_option("query", query_, "Search query")
        ->required()
        ->type_name("<query>");

    app.add_option("-n,--max", max_results_, "Maximum results (default: 20)")
        ->type_name("<num>")
        ->check(CLI::PositiveNumber);
}

int SearchCommand::execute(CommandContext& ctx) {
    auto store = open_store(ctx);
    if (!store) return SEMNOTE_EXIT_IO_ERROR;

    auto client = create_embedding_client(ctx);
    if (!client) return SEMNOTE_EXIT_IO_ERROR;

    DirectoryNoteSource notes(ctx.config.notes_directory, ctx.config.note_extensions);
    QueryEngine engine(*store, *client, &notes, *ctx.logger);

    auto result = engine.search(query_, max_results_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    const auto& results = result.value();
    if (results.empty()) {
        std::cout << "No matches found for: " << query_ << "\n";
        return SEMNOTE_EXIT_SUCCESS;
    }

    print_results(results);
    std::cout << results.size() << " result(s)\n";
    return SEMNOTE_EXIT_SUCCESS;
}

void SearchCommand::print_results(const std::vector<LocatedResult>& results) {
    for (const auto& r : results) {
        std::string location = r.path.empty() ? r.note_id : r.path.string();
        if (r.line > 0) {
            location += ":" + std::to_string(r.line) + ":" + std::to_string(r.column);
        }

        std::cout << location << "  "
                  << std::fixed << std::setprecision(4) << r.distance << "  "
                  << preview(r.text) << "\n";
    }
}

}  // namespace semnote::cli
