#include "generate_command.hpp"

namespace zk::cli {

void GenerateCommand::setup(CLI::App&) {}

int GenerateCommand::execute(CommandContext& ctx) {
    LinkRegistry registry(ctx.config.link_file, ctx.config.note_dir);

    auto result = registry.generate();
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return exit_code_for(result.error().code());
    }

    std::cout << "Wrote " << result.value() << " entries to "
              << ctx.config.link_file.string() << "\n";
    return ZK_EXIT_SUCCESS;
}

}  // namespace zk::cli
