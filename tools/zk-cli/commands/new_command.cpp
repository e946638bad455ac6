#include "new_command.hpp"

namespace zk::cli {

void NewCommand::setup(CLI::App& app) {
    app.add_flag("-m,--metadata", with_metadata_, "Include an empty metadata block");
}

int NewCommand::execute(CommandContext& ctx) {
    LinkRegistry registry(ctx.config.link_file, ctx.config.note_dir);

    auto result = create_note(ctx.config, registry, with_metadata_);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return exit_code_for(result.error().code());
    }

    std::cout << result.value().string() << "\n";
    return ZK_EXIT_SUCCESS;
}

}  // namespace zk::cli
