#include "serve_command.hpp"

#include <zk/protocol/request_handler.hpp>

#include <thread>

namespace zk::cli {

void ServeCommand::setup(CLI::App& app) {
    app.add_flag("--no-watch", no_watch_, "Do not watch the note directory");
}

int ServeCommand::execute(CommandContext& ctx) {
    auto index = std::make_shared<NoteIndex>(ctx.config, ctx.logger);
    auto registry = std::make_shared<LinkRegistry>(ctx.config.link_file, ctx.config.note_dir);

    ctx.logger->info("wiki root: " + ctx.config.root.string());

    // Requests are answered while the initial index is still filling
    std::thread rebuild([index, logger = ctx.logger]() {
        auto result = index->rebuild_full();
        if (result.ok()) {
            logger->info("indexed " + std::to_string(result.value()) + " notes");
        } else {
            logger->error("initial index failed: " + result.error().to_string());
        }
    });

    NoteWatcher watcher(ctx.config, index, registry, ctx.logger);
    if (!no_watch_) {
        auto started = watcher.start();
        if (!started.ok()) {
            ctx.logger->warning("file watching disabled: " + started.error().to_string());
        }
    }

    protocol::RequestHandler handler(ctx.config, index, registry, ctx.logger);

    std::string line;
    while (!handler.shutdown_requested() && std::getline(std::cin, line)) {
        if (parser::trim(line).empty()) continue;

        auto response = handler.handle_line(line);
        if (response) {
            std::cout << *response << "\n" << std::flush;
        }
    }

    watcher.stop();
    rebuild.join();
    return ZK_EXIT_SUCCESS;
}

}  // namespace zk::cli
