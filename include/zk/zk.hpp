#pragma once

/**
 * zk - Zettelkasten note server
 *
 * Keeps a live cross-reference index over a directory of Typst notes,
 * derives each note's status from its checklist, and propagates status
 * changes to the notes that reference it.
 */

#include <zk/types.hpp>
#include <zk/result.hpp>
#include <zk/config.hpp>
#include <zk/parser.hpp>
#include <zk/note_index.hpp>
#include <zk/formatting.hpp>
#include <zk/link_registry.hpp>
#include <zk/note_ops.hpp>
#include <zk/watcher.hpp>
#include <zk/util/logger.hpp>
