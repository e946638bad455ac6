#pragma once

#include <zk/types.hpp>

#include <chrono>
#include <optional>

namespace zk {

/**
 * Wiki layout and runtime settings.
 *
 * Notes live in `<root>/note`, the link registry in `<root>/link.typ`.
 */
struct Config {
    fs::path root;
    fs::path note_dir;
    fs::path link_file;
    std::chrono::milliseconds debounce{300};  // Watcher quiescence window
    size_t channel_capacity = 64;             // Batches buffered for the consumer

    /**
     * Build a config rooted at `root`.
     */
    static Config from_root(const fs::path& root);

    /**
     * Resolve the wiki root.
     *
     * Order: command-line flag, $WIKI_ROOT, client-supplied root,
     * $HOME/wiki, ./wiki.
     *
     * @param cli_root Root given on the command line
     * @param init_root Root supplied by the client at initialization
     */
    static Config resolve(const std::optional<fs::path>& cli_root,
                          const std::optional<fs::path>& init_root = std::nullopt);
};

}  // namespace zk
