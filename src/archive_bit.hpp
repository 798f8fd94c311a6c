#pragma once

#include <filesystem>
#include <string>

namespace nsp_split {

// Best-effort: sets FILE_ATTRIBUTE_ARCHIVE on `path` so consoles that read
// FAT32 split folders treat it as a single file. On Linux this only works on
// ntfs-3g style mounts exposing system.ntfs_attrib_be.
bool try_set_archive_bit(const std::filesystem::path& path, std::string& error);

}  // namespace nsp_split
