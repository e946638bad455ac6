#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace zk::cli {

/**
 * Delete a note and drop it from the link registry.
 */
class RemoveCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "remove"; }
    std::string description() const override {
        return "Delete a note";
    }

private:
    std::string id_;
    bool force_ = false;
};

}  // namespace zk::cli
