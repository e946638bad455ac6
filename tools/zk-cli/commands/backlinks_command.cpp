#include "backlinks_command.hpp"

#include <zk/protocol/json_codec.hpp>

namespace zk::cli {

void BacklinksCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Note ID")
        ->required()
        ->type_name("<id>");

    app.add_flag("--json", json_, "Print locations as JSON");
}

int BacklinksCommand::execute(CommandContext& ctx) {
    if (!parser::is_note_id(id_)) {
        std::cerr << "Error: Not a note ID: " << id_ << "\n";
        return ZK_EXIT_USER_ERROR;
    }

    auto index = load_index(ctx);
    if (!index) {
        return ZK_EXIT_IO_ERROR;
    }

    auto locations = index->get_backlinks(id_);

    if (json_) {
        std::cout << json(locations).dump(2) << "\n";
        return ZK_EXIT_SUCCESS;
    }

    if (locations.empty()) {
        std::cout << "No references to @" << id_ << "\n";
        return ZK_EXIT_SUCCESS;
    }

    // Lines are reported 1-based, like compiler diagnostics
    for (const auto& loc : locations) {
        std::cout << loc.file.string() << ":" << (loc.line + 1) << ":"
                  << (loc.start_char + 1) << "\n";
    }
    std::cout << "\n" << locations.size() << " reference(s)\n";
    return ZK_EXIT_SUCCESS;
}

}  // namespace zk::cli
