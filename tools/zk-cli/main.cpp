#include "commands/backlinks_command.hpp"
#include "commands/check_command.hpp"
#include "commands/format_command.hpp"
#include "commands/generate_command.hpp"
#include "commands/new_command.hpp"
#include "commands/remove_command.hpp"
#include "commands/search_command.hpp"
#include "commands/serve_command.hpp"

#include <exception>
#include <optional>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace zk::cli;

    CLI::App app{"zk - Zettelkasten note server"};
    app.require_subcommand(0, 1);

    std::string wiki_root;
    bool verbose = false;
    app.add_option("--wiki-root", wiki_root, "Wiki root directory (default: $WIKI_ROOT, ~/wiki)")
        ->type_name("<dir>");
    app.add_flag("-v,--verbose", verbose, "Debug logging");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<ServeCommand>());
    commands.push_back(std::make_unique<GenerateCommand>());
    commands.push_back(std::make_unique<NewCommand>());
    commands.push_back(std::make_unique<RemoveCommand>());
    commands.push_back(std::make_unique<FormatCommand>());
    commands.push_back(std::make_unique<SearchCommand>());
    commands.push_back(std::make_unique<BacklinksCommand>());
    commands.push_back(std::make_unique<CheckCommand>());

    std::vector<std::pair<CLI::App*, Command*>> subcommands;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        subcommands.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? ZK_EXIT_SUCCESS : ZK_EXIT_USER_ERROR;
    }

    CommandContext ctx;
    std::optional<zk::fs::path> cli_root;
    if (!wiki_root.empty()) {
        cli_root = zk::fs::path(wiki_root);
    }
    ctx.config = zk::Config::resolve(cli_root);
    ctx.logger = zk::make_console_logger(verbose);
    ctx.verbose = verbose;

    // No subcommand means serve
    Command* selected = commands.front().get();
    for (const auto& [sub, command] : subcommands) {
        if (sub->parsed()) {
            selected = command;
            break;
        }
    }

    try {
        return selected->execute(ctx);
    } catch (const std::exception& e) {
        ctx.logger->error(selected->name() + ": " + e.what());
        return ZK_EXIT_INTERNAL;
    }
}
