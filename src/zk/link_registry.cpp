#include <zk/link_registry.hpp>
#include <zk/parser.hpp>
#include <zk/util/file_io.hpp>

namespace zk {

namespace {

constexpr std::string_view ENTRY_PREFIX = "#include \"note/";

std::string entry_line(const NoteId& id) {
    return std::string(ENTRY_PREFIX) + id + NOTE_EXTENSION + "\"";
}

// `#include "note/<ID>.typ"` -> ID
std::optional<NoteId> parse_entry(std::string_view line) {
    line = parser::trim(line);
    if (line.compare(0, ENTRY_PREFIX.size(), ENTRY_PREFIX) != 0) {
        return std::nullopt;
    }
    std::string_view rest = line.substr(ENTRY_PREFIX.size());
    size_t quote = rest.find('"');
    if (quote == std::string_view::npos) {
        return std::nullopt;
    }
    fs::path file(std::string(rest.substr(0, quote)));
    if (!parser::is_note_filename(file)) {
        return std::nullopt;
    }
    return file.stem().string();
}

}  // namespace

LinkRegistry::LinkRegistry(fs::path link_file, fs::path note_dir)
    : link_file_(std::move(link_file))
    , note_dir_(std::move(note_dir))
{}

Result<void> LinkRegistry::add_entry(const NoteId& id) {
    if (!parser::is_note_id(id)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Not a note ID: " + id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto ids = load();
    if (!ids.ok()) {
        return ids.error();
    }
    if (!ids.value().insert(id).second) {
        return Ok();
    }
    return store(ids.value());
}

Result<void> LinkRegistry::remove_entry(const NoteId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ids = load();
    if (!ids.ok()) {
        return ids.error();
    }
    if (ids.value().erase(id) == 0) {
        return Ok();
    }
    return store(ids.value());
}

Result<size_t> LinkRegistry::generate() {
    std::set<NoteId> ids;
    std::error_code ec;
    fs::directory_iterator it(note_dir_, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot list " + note_dir_.string() + ": " + ec.message());
    }
    while (it != fs::directory_iterator()) {
        if (parser::is_note_filename(it->path())) {
            ids.insert(it->path().stem().string());
        }
        it.increment(ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Listing " + note_dir_.string() + " failed: " + ec.message());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto result = store(ids);
    if (!result.ok()) {
        return result.error();
    }
    return ids.size();
}

Result<std::set<NoteId>> LinkRegistry::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load();
}

// Caller holds mutex_
Result<std::set<NoteId>> LinkRegistry::load() const {
    std::set<NoteId> ids;
    std::error_code ec;
    bool present = fs::exists(link_file_, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot stat " + link_file_.string() + ": " + ec.message());
    }
    if (!present) {
        return ids;
    }

    auto content = read_file(link_file_);
    if (!content.ok()) {
        return content.error();
    }
    for (std::string_view line : parser::split_lines(content.value())) {
        if (auto id = parse_entry(line)) {
            ids.insert(std::move(*id));
        }
    }
    return ids;
}

// Caller holds mutex_
Result<void> LinkRegistry::store(const std::set<NoteId>& ids) const {
    std::string out = HEADER;
    out += '\n';
    for (const auto& id : ids) {
        out += entry_line(id);
        out += '\n';
    }

    if (link_file_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(link_file_.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Cannot create " + link_file_.parent_path().string() + ": " + ec.message());
        }
    }
    return write_file_atomic(link_file_, out);
}

}  // namespace zk
