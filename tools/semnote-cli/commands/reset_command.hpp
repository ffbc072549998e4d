#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace semnote::cli {

/**
 * Drop every document and embedding.
 */
class ResetCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "reset"; }
    std::string description() const override {
        return "Reset the index database";
    }

private:
    bool force_ = false;

    static bool confirm(const std::string& prompt);
};

}  // namespace semnote::cli
