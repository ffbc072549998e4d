#include "reindex_command.hpp"

namespace semnote::cli {

void ReindexCommand::setup(CLI::App& /*app*/) {}

int ReindexCommand::execute(CommandContext& ctx) {
    std::error_code ec;
    if (!fs::is_directory(ctx.config.notes_directory, ec)) {
        std::cerr << "Error: Notes directory not found: "
                  << ctx.config.notes_directory.string() << "\n";
        return SEMNOTE_EXIT_NOT_FOUND;
    }

    auto store = open_store(ctx);
    if (!store) return SEMNOTE_EXIT_IO_ERROR;

    auto client = create_embedding_client(ctx);
    if (!client) return SEMNOTE_EXIT_IO_ERROR;

    DirectoryNoteSource notes(ctx.config.notes_directory, ctx.config.note_extensions);
    IndexManager manager(*store, *client, Chunker(ctx.config.chunking), *ctx.logger,
                         ctx.config.max_concurrent_embeds);

    auto result = manager.reindex_all(notes);
    if (!result.ok()) {
        return report_error(result.error());
    }

    const auto& summary = result.value();
    for (const auto& failure : summary.failures) {
        std::cerr << "Warning: " << failure.note_id << " skipped: "
                  << failure.error.to_string() << "\n";
    }

    std::cout << "Reindexed " << summary.notes_indexed << " notes, "
              << summary.documents_inserted << " documents";
    if (summary.document_failures > 0) {
        std::cout << ", " << summary.document_failures << " failed";
    }
    std::cout << "\n";

    return summary.ok() ? SEMNOTE_EXIT_SUCCESS : SEMNOTE_EXIT_IO_ERROR;
}

}  // namespace semnote::cli
