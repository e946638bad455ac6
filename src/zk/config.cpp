#include <zk/config.hpp>

#include <cstdlib>

namespace zk {

Config Config::from_root(const fs::path& root) {
    Config config;
    config.root = root;
    config.note_dir = root / "note";
    config.link_file = root / "link.typ";
    return config;
}

Config Config::resolve(const std::optional<fs::path>& cli_root,
                       const std::optional<fs::path>& init_root) {
    if (cli_root.has_value() && !cli_root->empty()) {
        return from_root(*cli_root);
    }

    const char* env_root = std::getenv("WIKI_ROOT");
    if (env_root && env_root[0] != '\0') {
        return from_root(env_root);
    }

    if (init_root.has_value() && !init_root->empty()) {
        return from_root(*init_root);
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return from_root(fs::path(home) / "wiki");
    }
    return from_root(fs::path(".") / "wiki");
}

}  // namespace zk
