#include "core/ContextWriter.hpp"

namespace fs = std::filesystem;

namespace ctxpack {

Expected<void> ContextWriter::open(const fs::path& path, const std::string& preamble) {
    target = path;
    out.open(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to create " + path.string()};
    }
    out << preamble;
    out.flush();
    if (!out) return Error{ErrorCode::IoError, "Failed to write " + path.string()};
    return {};
}

Expected<void> ContextWriter::append(const PackedFileEntry& entry) {
    out << "\n## File: `" << entry.relativePath << "`\n\n```\n" << entry.content << "\n```\n";
    out.flush();
    if (!out) return Error{ErrorCode::IoError, "Failed to write " + target.string()};
    return {};
}

void ContextWriter::close() {
    if (out.is_open()) out.close();
}

}
