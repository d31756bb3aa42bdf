#include "util/AtomicFile.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

namespace cadenza::util {

bool write_file_atomically(const std::filesystem::path& path, const std::string& contents, std::string& error) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "cannot create " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            error = "cannot open " + tmp_path.string() + " for writing";
            return false;
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            error = "short write to " + tmp_path.string();
            out.close();
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        error = "cannot replace " + path.string() + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return false;
    }
    return true;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

}  // namespace cadenza::util
