#include "remove_command.hpp"

namespace zk::cli {

void RemoveCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Note ID")
        ->required()
        ->type_name("<id>");

    app.add_flag("-f,--force", force_, "Skip confirmation prompt");
}

int RemoveCommand::execute(CommandContext& ctx) {
    if (!parser::is_note_id(id_)) {
        std::cerr << "Error: Not a note ID: " << id_ << "\n";
        return ZK_EXIT_USER_ERROR;
    }

    fs::path path = ctx.config.note_dir / (id_ + NOTE_EXTENSION);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::cerr << "Error: Note not found: " << id_ << "\n";
        return ZK_EXIT_NOT_FOUND;
    }

    // Confirm deletion unless --force
    if (!force_) {
        std::cout << "Remove note " << id_ << "? [y/N] ";
        std::string response;
        std::getline(std::cin, response);
        if (response != "y" && response != "Y") {
            std::cout << "Cancelled.\n";
            return ZK_EXIT_SUCCESS;
        }
    }

    LinkRegistry registry(ctx.config.link_file, ctx.config.note_dir);
    auto result = delete_note(id_, ctx.config, registry);
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return exit_code_for(result.error().code());
    }

    std::cout << "Removed note " << id_ << "\n";
    return ZK_EXIT_SUCCESS;
}

}  // namespace zk::cli
