#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace usd::util {

std::string readFileToString(const std::filesystem::path& path);

// The new content replaced the old one, but the directory entry could not be flushed.
class UnsyncedRename : public std::system_error {
public:
    using std::system_error::system_error;
};

// Writes to a temporary sibling, fsyncs it, renames it over `path` and fsyncs the directory.
// Readers see either the old or the new content. Throws std::system_error when `path` still
// holds the old content, UnsyncedRename when only the final directory fsync failed.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content, unsigned mode = 0600);

// Last `lines` lines of a text file; empty when the file does not exist.
std::vector<std::string> tailLines(const std::filesystem::path& path, std::size_t lines);

// mkdir -p that also tightens the leaf directory to `mode`.
void ensurePrivateDir(const std::filesystem::path& dir, unsigned mode = 0700);

std::string generate_random_suffix(std::size_t length = 8);

}
