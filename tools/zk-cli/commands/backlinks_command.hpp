#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * List every place that references a note.
 */
class BacklinksCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "backlinks"; }
    std::string description() const override {
        return "List references to a note";
    }

private:
    std::string id_;
    bool json_ = false;
};

}  // namespace zk::cli
