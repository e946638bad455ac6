#include <zk/note_index.hpp>
#include <zk/parser.hpp>
#include <zk/util/file_io.hpp>

#include <algorithm>

namespace zk {

namespace {

// Simple lowercase mapping for ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic
char32_t fold_code_point(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 32;
    if (cp < 0xC0) return cp;
    if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 32;
    if (cp >= 0x0100 && cp <= 0x017F) {
        if (cp == 0x0130) return U'i';
        if (cp == 0x0178) return 0x00FF;
        bool odd_upper = (cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E);
        bool even_upper = (cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
                          (cp >= 0x014A && cp <= 0x0177);
        if (odd_upper && (cp % 2) == 1) return cp + 1;
        if (even_upper && (cp % 2) == 0) return cp + 1;
        return cp;
    }
    if (cp == 0x0386) return 0x03AC;
    if (cp >= 0x0388 && cp <= 0x038A) return cp + 37;
    if (cp == 0x038C) return 0x03CC;
    if (cp == 0x038E || cp == 0x038F) return cp + 63;
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 32;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 80;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 32;
    return cp;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Folded code points all sit below U+0800, so only one- and two-byte
// sequences are decoded; everything else is copied through unchanged.
std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out += static_cast<char>(fold_code_point(c));
            ++i;
            continue;
        }
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size() &&
            (static_cast<unsigned char>(s[i + 1]) & 0xC0) == 0x80) {
            char32_t cp = (static_cast<char32_t>(c & 0x1F) << 6) |
                          (static_cast<unsigned char>(s[i + 1]) & 0x3F);
            if (cp >= 0x80) {
                append_utf8(out, fold_code_point(cp));
                i += 2;
                continue;
            }
        }
        out += s[i];
        ++i;
    }
    return out;
}

bool contains_ci(const std::string& haystack, const std::string& lowered_needle) {
    return to_lower(haystack).find(lowered_needle) != std::string::npos;
}

NoteInfo make_info(NoteHeader header, const fs::path& path) {
    NoteInfo info;
    info.id = std::move(header.id);
    info.title = std::move(header.title);
    info.archived = header.archived;
    info.legacy = header.legacy;
    info.alt_id = std::move(header.alt_id);
    info.evo_id = std::move(header.evo_id);
    info.aliases = std::move(header.aliases);
    info.keywords = std::move(header.keywords);
    info.abstract_text = std::move(header.abstract_text);
    info.path = path;
    return info;
}

}  // namespace

NoteIndex::NoteIndex(Config config, std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , logger_(or_null_logger(std::move(logger)))
{}

fs::path NoteIndex::normalize_path(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return absolute.lexically_normal();
}

Result<size_t> NoteIndex::rebuild_full() {
    std::vector<fs::path> paths;
    std::error_code ec;
    fs::directory_iterator it(config_.note_dir, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot list " + config_.note_dir.string() + ": " + ec.message());
    }
    while (it != fs::directory_iterator()) {
        if (parser::is_note_filename(it->path())) {
            paths.push_back(normalize_path(it->path()));
        }
        it.increment(ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Listing " + config_.note_dir.string() + " failed: " + ec.message());
        }
    }

    notes_.clear();
    backlinks_.clear();

    for (const auto& path : paths) {
        auto result = index_file(path);
        if (!result.ok()) {
            logger_->debug("skipping " + path.string() + ": " + result.error().to_string());
        }
    }

    return notes_.size();
}

Result<void> NoteIndex::update_file(const fs::path& path) {
    fs::path normalized = normalize_path(path);
    remove_backlinks_from(normalized);
    return index_file(normalized);
}

void NoteIndex::remove_by_path(const fs::path& path) {
    fs::path normalized = normalize_path(path);
    notes_.erase(normalized.stem().string());
    remove_backlinks_from(normalized);
}

std::optional<NoteInfo> NoteIndex::get(const NoteId& id) const {
    return notes_.get(id);
}

std::vector<BacklinkLocation> NoteIndex::get_backlinks(const NoteId& id) const {
    return backlinks_.get(id).value_or(std::vector<BacklinkLocation>{});
}

std::vector<NoteInfo> NoteIndex::search(const std::string& query) const {
    std::string q = to_lower(query);
    std::vector<NoteInfo> result;

    notes_.for_each([&](const NoteId&, const NoteInfo& n) {
        bool match = contains_ci(n.title, q) ||
                     n.id.find(q) != std::string::npos ||
                     std::any_of(n.aliases.begin(), n.aliases.end(),
                                 [&q](const std::string& a) { return contains_ci(a, q); }) ||
                     std::any_of(n.keywords.begin(), n.keywords.end(),
                                 [&q](const std::string& k) { return contains_ci(k, q); }) ||
                     (n.abstract_text.has_value() && contains_ci(*n.abstract_text, q));
        if (match) {
            result.push_back(n);
        }
    });

    return result;
}

// ============================================================================
// Private helpers
// ============================================================================

Result<void> NoteIndex::index_file(const fs::path& path) {
    auto content = read_file(path);
    if (!content.ok()) {
        return content.error();
    }
    const std::string& text = content.value();

    // The header's own ID is authoritative, even if it differs from the stem
    if (auto header = parser::parse_header(text)) {
        NoteId id = header->id;
        notes_.insert_or_assign(id, make_info(std::move(*header), path));
    }

    // Offsets leave the index as UTF-16, converted while the line is at hand
    auto lines = parser::split_lines(text);
    for (const auto& ref : parser::find_all_refs(text)) {
        std::string_view line_text = ref.line < lines.size() ? lines[ref.line] : std::string_view{};
        BacklinkLocation loc;
        loc.file = path;
        loc.line = ref.line;
        loc.start_char = parser::byte_to_utf16(line_text, ref.start_char);
        loc.end_char = parser::byte_to_utf16(line_text, ref.end_char);
        backlinks_.upsert(ref.id, [&loc](std::vector<BacklinkLocation>& locs) {
            locs.push_back(std::move(loc));
        });
    }

    return Ok();
}

void NoteIndex::remove_backlinks_from(const fs::path& path) {
    backlinks_.retain([&path](const NoteId&, std::vector<BacklinkLocation>& locs) {
        locs.erase(std::remove_if(locs.begin(), locs.end(),
                                  [&path](const BacklinkLocation& loc) { return loc.file == path; }),
                   locs.end());
        return !locs.empty();
    });
}

}  // namespace zk
