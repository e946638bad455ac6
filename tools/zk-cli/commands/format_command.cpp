#include "format_command.hpp"

#include <zk/util/file_io.hpp>

namespace zk::cli {

void FormatCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Note file (default: stdin)")
        ->type_name("<file>");

    app.add_flag("-i,--in-place", in_place_, "Rewrite the file instead of printing");
}

int FormatCommand::execute(CommandContext& ctx) {
    if (in_place_ && file_.empty()) {
        std::cerr << "Usage: zk format <file> --in-place\n";
        return ZK_EXIT_USER_ERROR;
    }

    std::string content;
    if (file_.empty()) {
        content = read_stdin();
    } else {
        auto read = read_file(file_);
        if (!read.ok()) {
            std::cerr << "Error: " << read.error().to_string() << "\n";
            return ZK_EXIT_IO_ERROR;
        }
        content = std::move(read).value();
    }

    std::string formatted = format_content(content, ctx.config.note_dir);

    if (!in_place_) {
        std::cout << formatted;
        return ZK_EXIT_SUCCESS;
    }

    if (formatted == content) {
        return ZK_EXIT_SUCCESS;
    }
    auto written = write_file_atomic(file_, formatted);
    if (!written.ok()) {
        std::cerr << "Error: " << written.error().to_string() << "\n";
        return ZK_EXIT_IO_ERROR;
    }
    return ZK_EXIT_SUCCESS;
}

}  // namespace zk::cli
