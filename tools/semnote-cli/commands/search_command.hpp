#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace semnote::cli {

/**
 * Find the documents most similar to a query.
 */
class SearchCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "search"; }
    std::string description() const override {
        return "Search notes by meaning";
    }

private:
    std::string query_;
    size_t max_results_ = QueryEngine::DEFAULT_K;

    void print_results(const std::vector<LocatedResult>& results);
};

}  // namespace semnote::cli
