#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace semnote::cli {

/**
 * Reindex every note in the notes directory.
 */
class ReindexCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "reindex"; }
    std::string description() const override {
        return "Reindex all notes";
    }
};

}  // namespace semnote::cli
