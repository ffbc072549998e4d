#include "stats_command.hpp"

namespace semnote::cli {

void StatsCommand::setup(CLI::App& /*app*/) {}

int StatsCommand::execute(CommandContext& ctx) {
    auto store = open_store(ctx);
    if (!store) return SEMNOTE_EXIT_IO_ERROR;

    auto documents = store->count_documents();
    if (!documents.ok()) return report_error(documents.error());

    auto embeddings = store->count_embeddings();
    if (!embeddings.ok()) return report_error(embeddings.error());

    auto notes = store->list_note_ids();
    if (!notes.ok()) return report_error(notes.error());

    std::cout << "Database:   " << ctx.config.database_path.string() << "\n";
    std::cout << "Notes:      " << notes.value().size() << "\n";
    std::cout << "Documents:  " << documents.value() << "\n";
    std::cout << "Embeddings: " << embeddings.value() << "\n";
    std::cout << "Dimension:  " << store->dimension() << "\n";
    std::cout << "Chunking:   " << chunk_policy_name(ctx.config.chunking) << "\n";
    std::cout << "Model:      " << ctx.config.embedder.model << "\n";

    return SEMNOTE_EXIT_SUCCESS;
}

}  // namespace semnote::cli
