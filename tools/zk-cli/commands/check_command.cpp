#include "check_command.hpp"

#include <zk/handlers/diagnostics.hpp>
#include <zk/protocol/json_codec.hpp>
#include <zk/util/file_io.hpp>

namespace zk::cli {

void CheckCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Note file")
        ->required()
        ->type_name("<file>");
}

int CheckCommand::execute(CommandContext& ctx) {
    auto content = read_file(file_);
    if (!content.ok()) {
        std::cerr << "Error: " << content.error().to_string() << "\n";
        return ZK_EXIT_IO_ERROR;
    }

    auto index = load_index(ctx);
    if (!index) {
        return ZK_EXIT_IO_ERROR;
    }

    auto diagnostics = handlers::get_diagnostics(content.value(), *index);
    std::cout << json(diagnostics).dump(2) << "\n";
    return ZK_EXIT_SUCCESS;
}

}  // namespace zk::cli
