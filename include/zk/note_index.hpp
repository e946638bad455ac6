#pragma once

#include <zk/config.hpp>
#include <zk/result.hpp>
#include <zk/types.hpp>
#include <zk/util/concurrent_map.hpp>
#include <zk/util/logger.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zk {

/**
 * NoteIndex - Live cross-reference index over the note directory.
 *
 * Maintains two concurrent maps:
 * - notes:     NoteId -> NoteInfo
 * - backlinks: NoteId -> locations of `@NoteId` in other files
 *
 * Per-file operations may be called concurrently from the watcher and from
 * request handlers. Each map mutation is atomic per key, but no lock spans
 * a sequence of mutations: a reader may briefly see a file's old backlinks
 * purged before the new ones are added, and a full rebuild is visible
 * while it is in progress.
 */
class NoteIndex {
public:
    /**
     * @param config Wiki layout (only note_dir is used)
     * @param logger Logger for skipped files; may be null
     */
    explicit NoteIndex(Config config, std::shared_ptr<Logger> logger = nullptr);

    /**
     * Clear both maps and re-index every `<ID>.typ` file in the note
     * directory. Unreadable files are skipped.
     *
     * @return Number of notes indexed, or IO_ERROR if the directory
     *         cannot be listed
     */
    Result<size_t> rebuild_full();

    /**
     * Re-index one file after its content changed.
     * The file's previous backlink contributions are purged first. If the
     * file cannot be read it contributes nothing and IO_ERROR is returned.
     */
    Result<void> update_file(const fs::path& path);

    /**
     * Forget a deleted file: drops the note keyed by the file's stem and
     * every backlink location the file contributed.
     */
    void remove_by_path(const fs::path& path);

    /**
     * Look up a note by ID.
     */
    std::optional<NoteInfo> get(const NoteId& id) const;

    /**
     * All known reference locations pointing at `id`.
     */
    std::vector<BacklinkLocation> get_backlinks(const NoteId& id) const;

    /**
     * Case-insensitive substring search over title, ID, aliases, keywords
     * and abstract. Unranked.
     *
     * Case folding covers ASCII, Latin-1, Latin Extended-A, Greek and
     * Cyrillic. Other scripts compare byte for byte.
     */
    std::vector<NoteInfo> search(const std::string& query) const;

    /**
     * Number of indexed notes.
     */
    size_t size() const { return notes_.size(); }

    /**
     * Number of IDs with at least one backlink.
     */
    size_t backlink_target_count() const { return backlinks_.size(); }

    const Config& config() const { return config_; }

    /**
     * Canonical form used for stored paths: absolute and lexically normal.
     */
    static fs::path normalize_path(const fs::path& path);

private:
    Result<void> index_file(const fs::path& path);
    void remove_backlinks_from(const fs::path& path);

    Config config_;
    std::shared_ptr<Logger> logger_;
    ConcurrentMap<NoteId, NoteInfo> notes_;
    ConcurrentMap<NoteId, std::vector<BacklinkLocation>> backlinks_;
};

}  // namespace zk
