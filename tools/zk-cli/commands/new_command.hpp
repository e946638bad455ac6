#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * Create a note for the current minute.
 */
class NewCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "new"; }
    std::string description() const override {
        return "Create a new note and print its path";
    }

private:
    bool with_metadata_ = false;
};

}  // namespace zk::cli
