#pragma once

#include <filesystem>
#include <string>

// Suffix of the hidden staging file a receiver writes before the final rename.
inline constexpr const char* kStagingSuffix = ".lantern-part";

// Reduces an untrusted filename to a bare name that is safe to join onto the
// shared directory. Throws PathSafetyViolation when the input contains a NUL
// byte, has any ".." component, is empty/"." after reduction, names a
// reserved device (CON, PRN, AUX, NUL, COM1-9, LPT1-9, with or without an
// extension, any case) or collides with the staging-file naming scheme.
// No filesystem access happens here.
std::string sanitize_filename(const std::string& untrusted);

bool is_reserved_device_name(const std::string& name);

// True for names the node manages internally and never lists or serves.
bool is_internal_name(const std::string& name);

// shared_dir / sanitize_filename(untrusted)
std::filesystem::path resolve_in_directory(const std::filesystem::path& shared_dir,
                                           const std::string& untrusted);

// destination_dir/.<name>.<tag>.lantern-part. Concurrent receives of one name
// pass distinct tags so each writes its own staging file.
std::filesystem::path staging_path_for(const std::filesystem::path& destination,
                                       const std::string& tag);
