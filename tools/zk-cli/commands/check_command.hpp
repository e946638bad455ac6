#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * Print diagnostics for a note as JSON.
 */
class CheckCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "check"; }
    std::string description() const override {
        return "Report references to archived and legacy notes";
    }

private:
    std::string file_;
};

}  // namespace zk::cli
