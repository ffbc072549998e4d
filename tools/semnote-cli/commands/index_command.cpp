#include "index_command.hpp"

namespace semnote::cli {

void IndexCommand::setup(CLI::App& app) {
    app.add_option("path", path_, "Path of the note file")
        ->required()
        ->type_name("<path>");
}

int IndexCommand::execute(CommandContext& ctx) {
    auto store = open_store(ctx);
    if (!store) return SEMNOTE_EXIT_IO_ERROR;

    auto client = create_embedding_client(ctx);
    if (!client) return SEMNOTE_EXIT_IO_ERROR;

    DirectoryNoteSource notes(ctx.config.notes_directory, ctx.config.note_extensions);
    IndexManager manager(*store, *client, Chunker(ctx.config.chunking), *ctx.logger,
                         ctx.config.max_concurrent_embeds);

    std::error_code ec;
    fs::path path = fs::absolute(path_, ec);
    if (ec) {
        std::cerr << "Error: Invalid path: " << path_ << "\n";
        return SEMNOTE_EXIT_USER_ERROR;
    }

    auto result = manager.reindex_path(notes, path);
    if (!result.ok()) {
        return report_error(result.error());
    }

    const auto& report = result.value();
    for (const auto& failure : report.failures) {
        std::cerr << "Warning: document at offset " << failure.start_offset
                  << " not indexed: " << failure.error.to_string() << "\n";
    }

    std::cout << "Indexed " << report.note_id << ": " << report.inserted.size()
              << " of " << report.chunks << " documents";
    if (report.removed > 0) {
        std::cout << " (replaced " << report.removed << ")";
    }
    std::cout << "\n";

    return report.ok() ? SEMNOTE_EXIT_SUCCESS : SEMNOTE_EXIT_IO_ERROR;
}

}  // namespace semnote::cli
