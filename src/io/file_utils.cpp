// =============================================================================
// refdb - Filesystem Utilities Implementation
// =============================================================================

#include "refdb/io/file_utils.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include "refdb/common/error.h"
#include "refdb/common/types.h"

namespace refdb::io {

namespace fs = std::filesystem;

std::uint64_t fileSizeOrZero(const fs::path& path) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return 0;
    }
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

bool isNonEmptyFile(const fs::path& path) noexcept {
    return fileSizeOrZero(path) > 0;
}

fs::path partialPath(const fs::path& path) {
    fs::path partial = path;
    partial += kPartialSuffix;
    return partial;
}

std::vector<fs::path> listFilesWithExtension(const fs::path& dir, std::string_view extension) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return files;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw IOError("Cannot list directory", ec, ErrorContext(dir.string()));
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (entry.path().extension().string() == extension) {
            files.push_back(entry.path());
        }
    }

    // Directory iteration order is filesystem dependent
    std::sort(files.begin(), files.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
    return files;
}

void ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("Cannot create directory", ec, ErrorContext(dir.string()));
    }
}

void copyFileAtomic(const fs::path& from, const fs::path& to) {
    const fs::path partial = partialPath(to);
    std::error_code ec;
    fs::copy_file(from, partial, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        removeQuietly(partial);
        throw IOError("Cannot copy " + from.string(), ec, ErrorContext(to.string()));
    }
    commitPartial(partial, to);
}

void commitPartial(const fs::path& partial, const fs::path& target) {
    std::error_code ec;
    fs::rename(partial, target, ec);
    if (ec) {
        removeQuietly(partial);
        throw IOError("Cannot move file into place", ec, ErrorContext(target.string()));
    }
}

void removeQuietly(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
}

void appendLine(const fs::path& path, std::string_view line) {
    std::ofstream out(path, std::ios::app);
    if (!out) {
        throw IOError("Cannot open for appending", ErrorContext(path.string()));
    }
    out << line << '\n';
    if (!out.flush()) {
        throw IOError("Write failed", ErrorContext(path.string()));
    }
}

void writeLinesAtomic(const fs::path& path, const std::vector<std::string>& lines) {
    const fs::path partial = partialPath(path);
    {
        std::ofstream out(partial, std::ios::trunc);
        if (!out) {
            throw IOError("Cannot open for writing", ErrorContext(partial.string()));
        }
        for (const auto& line : lines) {
            out << line << '\n';
        }
        if (!out.flush()) {
            out.close();
            removeQuietly(partial);
            throw IOError("Write failed", ErrorContext(partial.string()));
        }
    }
    commitPartial(partial, path);
}

std::vector<std::string> readLines(const fs::path& path) {
    std::vector<std::string> lines;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return lines;
    }

    std::ifstream in(path);
    if (!in) {
        throw IOError("Cannot open for reading", ErrorContext(path.string()));
    }
    std::string line;
    while (std::getline(in, line)) {
        const auto trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.emplace_back(trimmed);
        }
    }
    if (in.bad()) {
        throw IOError("Read failed", ErrorContext(path.string()));
    }
    return lines;
}

std::string_view trim(std::string_view str) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n\v\f";
    const auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

}  // namespace refdb::io
