#include "utils/AtomicFile.h"
#include "core/Errors.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace fs = std::filesystem;

namespace AtomicFile {

std::string read(const std::string& path) {
    fs::path p = fs::u8path(path);
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        throw CortexError(ErrorKind::NotFound, "File not found: " + path);
    }
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        throw CortexError(ErrorKind::IoError, "Failed to read " + path);
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void write(const std::string& path, const std::string& content) {
    fs::path target = fs::u8path(path);
    fs::path tmp = target;
    tmp += ".cortex-act." + std::to_string(::getpid()) + ".tmp";

    std::error_code ec;
    fs::perms mode = fs::status(target, ec).permissions();
    bool keepMode = !ec && mode != fs::perms::unknown;

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CortexError(ErrorKind::IoError, "Cannot open temp file for write: " + tmp.u8string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw CortexError(ErrorKind::IoError, "Write failed: " + tmp.u8string());
        }
    }

    if (keepMode) {
        fs::permissions(tmp, mode, fs::perm_options::replace, ec);
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw CortexError(ErrorKind::IoError, "Failed to replace " + path + ": " + ec.message());
    }
}

} // namespace AtomicFile
