#pragma once

#include <zk/result.hpp>
#include <zk/types.hpp>

#include <mutex>
#include <set>
#include <string>

namespace zk {

/**
 * LinkRegistry - The `link.typ` file that includes every note.
 *
 * Format: a header comment followed by one `#include "note/<ID>.typ"` line
 * per note, sorted by ID. Rewrites are serialized so the watcher and
 * request handlers can update it concurrently.
 */
class LinkRegistry {
public:
    static constexpr const char* HEADER = "// zk link registry: generated, do not edit";

    /**
     * @param link_file Registry file path
     * @param note_dir Directory scanned by generate()
     */
    LinkRegistry(fs::path link_file, fs::path note_dir);

    /**
     * Register a note. No-op if already present.
     */
    Result<void> add_entry(const NoteId& id);

    /**
     * Deregister a note. No-op if absent or if the file does not exist.
     */
    Result<void> remove_entry(const NoteId& id);

    /**
     * Rebuild the registry from the note files on disk.
     * @return Number of entries written
     */
    Result<size_t> generate();

    /**
     * Read the registered IDs.
     * A missing registry file yields an empty set.
     */
    Result<std::set<NoteId>> entries() const;

    const fs::path& path() const { return link_file_; }

private:
    Result<std::set<NoteId>> load() const;
    Result<void> store(const std::set<NoteId>& ids) const;

    fs::path link_file_;
    fs::path note_dir_;
    mutable std::mutex mutex_;
};

}  // namespace zk
