#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * Format a note: read it on stdin (or from a file), write the result to
 * stdout (or back to the file with --in-place).
 */
class FormatCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "format"; }
    std::string description() const override {
        return "Reconcile checklists and the status tag of a note";
    }

private:
    std::string file_;
    bool in_place_ = false;
};

}  // namespace zk::cli
