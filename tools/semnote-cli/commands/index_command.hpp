#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace semnote::cli {

/**
 * Reindex a single note file.
 */
class IndexCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "index"; }
    std::string description() const override {
        return "Reindex one note file";
    }

private:
    std::string path_;
};

}  // namespace semnote::cli
