#pragma once

#include <zk/config.hpp>
#include <zk/link_registry.hpp>
#include <zk/result.hpp>

#include <chrono>
#include <string>

namespace zk {

/**
 * Note ID for a point in time: local time as YYMMDDHHMM.
 */
NoteId note_id_for(std::chrono::system_clock::time_point when);

/**
 * Template for a fresh note.
 *
 * @param id The note ID
 * @param with_metadata Prepend an empty metadata block
 */
std::string note_template(const NoteId& id, bool with_metadata);

/**
 * Create a note for the current minute and register it.
 * An existing file with the same ID is left untouched.
 *
 * @return Path of the note
 */
Result<fs::path> create_note(const Config& config, LinkRegistry& registry, bool with_metadata);

/**
 * Delete a note file (if present) and deregister it.
 */
Result<void> delete_note(const NoteId& id, const Config& config, LinkRegistry& registry);

}  // namespace zk
