#include <zk/util/file_io.hpp>

#include <fstream>
#include <sstream>

namespace zk {

Result<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Read failed: " + path.string());
    }
    return ss.str();
}

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    fs::path temp = path;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error(ErrorCode::IO_ERROR, "Cannot create " + temp.string());
        }
        out << content;
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Error(ErrorCode::IO_ERROR, "Write failed: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Error(ErrorCode::IO_ERROR,
                     "Rename to " + path.string() + " failed: " + ec.message());
    }
    return Ok();
}

}  // namespace zk
