#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace semnote::cli {

/**
 * Show index statistics.
 */
class StatsCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "stats"; }
    std::string description() const override {
        return "Show index statistics";
    }
};

}  // namespace semnote::cli
