#pragma once

#include <zk/zk.hpp>
#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace zk::cli {

/**
 * Context passed to command execution.
 * Holds the resolved wiki layout and the process logger.
 */
struct CommandContext {
    Config config;
    std::shared_ptr<Logger> logger;
    bool verbose = false;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with config and logger
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "serve", "search").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Build and fully populate an index for the wiki.
 * Prints error to stderr on failure.
 *
 * @return Populated index, or nullptr on error
 */
inline std::shared_ptr<NoteIndex> load_index(const CommandContext& ctx) {
    auto index = std::make_shared<NoteIndex>(ctx.config, ctx.logger);
    auto result = index->rebuild_full();
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return nullptr;
    }
    ctx.logger->debug("indexed " + std::to_string(result.value()) + " notes");
    return index;
}

/**
 * Read from stdin until EOF.
 */
inline std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

/**
 * Truncate a string for display, adding "..." if needed.
 *
 * @param s The string to truncate
 * @param max_len Maximum length (including "..." if truncated)
 * @return Truncated string
 */
inline std::string truncate(const std::string& s, size_t max_len) {
    if (max_len <= 3) return s.substr(0, max_len);
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len - 3) + "...";
}

}  // namespace zk::cli
