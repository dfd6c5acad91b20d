#include "file_index.hpp"

#include <algorithm>
#include <cstdlib>

#include "path_safety.hpp"

FileIndex::FileIndex(std::filesystem::path root) : root_(std::move(root)) {}

bool FileIndex::ensure_root(std::string& error) const {
    std::error_code ec;
    if(std::filesystem::is_directory(root_, ec)) return true;
    std::filesystem::create_directories(root_, ec);
    if(ec){
        error = "cannot create shared directory " + root_.string() + ": " + ec.message();
        return false;
    }
    return true;
}

std::vector<FileEntry> FileIndex::list() const {
    std::vector<FileEntry> out;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if(ec) return out;
    for(const auto& entry : it){
        std::error_code entry_ec;
        if(!entry.is_regular_file(entry_ec) || entry_ec) continue;
        auto name = entry.path().filename().string();
        if(is_internal_name(name)) continue;
        auto size = entry.file_size(entry_ec);
        if(entry_ec) continue;
        out.push_back(FileEntry{name, size});
    }
    std::sort(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b){
        return a.name < b.name;
    });
    return out;
}

std::optional<FileEntry> FileIndex::find(const std::string& untrusted) const {
    auto name = sanitize_filename(untrusted);
    auto path = root_ / name;
    std::error_code ec;
    if(!std::filesystem::is_regular_file(path, ec) || ec) return std::nullopt;
    auto size = std::filesystem::file_size(path, ec);
    if(ec) return std::nullopt;
    return FileEntry{name, size};
}

std::filesystem::path FileIndex::destination_for(const std::string& untrusted) const {
    return resolve_in_directory(root_, untrusted);
}

std::filesystem::path default_shared_dir() {
    if(const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg){
        return std::filesystem::path(xdg) / "lantern" / "shared";
    }
    if(const char* home = std::getenv("HOME"); home && *home){
        return std::filesystem::path(home) / ".local" / "share" / "lantern" / "shared";
    }
    return std::filesystem::current_path() / "shared_files";
}
