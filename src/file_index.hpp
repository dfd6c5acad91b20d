#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct FileEntry {
    std::string name;
    uint64_t size = 0;
};

// View of the flat shared directory. Nothing is cached: every call reads the
// directory so files dropped in by hand show up at once.
class FileIndex {
public:
    explicit FileIndex(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    // Creates the directory if absent; returns false with `error` set on failure.
    bool ensure_root(std::string& error) const;

    // Regular files only, sorted by name; staging files and subdirectories
    // are skipped.
    std::vector<FileEntry> list() const;

    // Sanitizes `untrusted` and returns the entry when it names an existing
    // regular file. Throws PathSafetyViolation for unsafe names.
    std::optional<FileEntry> find(const std::string& untrusted) const;

    // Destination for an incoming file; throws PathSafetyViolation.
    std::filesystem::path destination_for(const std::string& untrusted) const;

private:
    std::filesystem::path root_;
};

// $XDG_DATA_HOME/lantern/shared, else ~/.local/share/lantern/shared, else
// ./shared_files.
std::filesystem::path default_shared_dir();
