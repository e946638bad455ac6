#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * Regenerate link.typ from the note directory.
 */
class GenerateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "generate"; }
    std::string description() const override {
        return "Regenerate the link registry";
    }
};

}  // namespace zk::cli
