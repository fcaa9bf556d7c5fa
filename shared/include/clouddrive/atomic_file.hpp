#pragma once

#include <filesystem>
#include <string_view>

namespace clouddrive
{

    // Writes `content` to "<path>.tmp" and renames it over `path`, so readers only ever see
    // the old or the new document. Creates missing parent directories. Throws
    // clouddrive::Error(StateStoreFailure) on failure; a previous file is left untouched.
    void write_file_atomically(const std::filesystem::path &path, std::string_view content,
                               std::filesystem::perms permissions = std::filesystem::perms::owner_read |
                                                                    std::filesystem::perms::owner_write);

} // namespace clouddrive
