#include <zk/note_ops.hpp>
#include <zk/parser.hpp>
#include <zk/util/file_io.hpp>

#include <ctime>

namespace zk {

NoteId note_id_for(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);

    char buf[16];
    size_t n = std::strftime(buf, sizeof(buf), "%y%m%d%H%M", &local);
    return NoteId(buf, n);
}

std::string note_template(const NoteId& id, bool with_metadata) {
    std::string out;
    if (with_metadata) {
        out += "/* Metadata:\n"
               "Aliases: \n"
               "Abstract: \n"
               "Keyword: \n"
               "Generated: true\n"
               "*/\n";
    }
    out += std::string(parser::IMPORT_LINE) + "\n";
    out += "#show: zettel\n\n";
    out += "=  <" + id + ">\n";
    out += "#tag.\n\n";
    return out;
}

Result<fs::path> create_note(const Config& config, LinkRegistry& registry, bool with_metadata) {
    NoteId id = note_id_for(std::chrono::system_clock::now());

    std::error_code ec;
    fs::create_directories(config.note_dir, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Cannot create " + config.note_dir.string() + ": " + ec.message());
    }

    fs::path path = config.note_dir / (id + NOTE_EXTENSION);
    bool present = fs::exists(path, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Cannot stat " + path.string() + ": " + ec.message());
    }
    if (!present) {
        auto written = write_file_atomic(path, note_template(id, with_metadata));
        if (!written.ok()) {
            return written.error();
        }
    }

    auto registered = registry.add_entry(id);
    if (!registered.ok()) {
        return registered.error();
    }
    return path;
}

Result<void> delete_note(const NoteId& id, const Config& config, LinkRegistry& registry) {
    if (!parser::is_note_id(id)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Not a note ID: " + id);
    }

    fs::path path = config.note_dir / (id + NOTE_EXTENSION);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Cannot delete " + path.string() + ": " + ec.message());
    }

    return registry.remove_entry(id);
}

}  // namespace zk
