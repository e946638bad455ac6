#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * Search notes by title, ID, alias, keyword or abstract.
 */
class SearchCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "search"; }
    std::string description() const override {
        return "Search notes";
    }

private:
    std::string query_;
    bool json_ = false;
    size_t max_results_ = 20;

    void print_results(const std::vector<NoteInfo>& notes);
};

}  // namespace zk::cli
