#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * Run the note server: index in the background, watch the note directory
 * and answer JSON-RPC requests on stdin.
 */
class ServeCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "serve"; }
    std::string description() const override {
        return "Serve requests on stdin/stdout (default)";
    }

private:
    bool no_watch_ = false;
};

}  // namespace zk::cli
