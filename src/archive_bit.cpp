#include "archive_bit.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <system_error>

#if defined(__linux__)
#include <sys/types.h>
#include <sys/xattr.h>
#elif defined(_WIN32)
#include <windows.h>
#endif

namespace nsp_split {

#if defined(__linux__)

namespace {

constexpr const char* kNtfsAttribName = "system.ntfs_attrib_be";
constexpr std::uint32_t kFileAttributeArchive = 0x20;

}  // namespace

bool try_set_archive_bit(const std::filesystem::path& path, std::string& error) {
    std::error_code ec;
    const auto real = std::filesystem::canonical(path, ec);
    if (ec) {
        error = "cannot resolve " + path.string() + ": " + ec.message();
        return false;
    }

    std::array<unsigned char, 4> raw{};
    const ssize_t n = getxattr(real.c_str(), kNtfsAttribName, raw.data(), raw.size());
    if (n < 0) {
        error = std::string("getxattr ") + kNtfsAttribName + " failed: " + std::strerror(errno);
        return false;
    }
    if (n != static_cast<ssize_t>(raw.size())) {
        error = std::string("unexpected ") + kNtfsAttribName + " size " + std::to_string(n);
        return false;
    }

    std::uint32_t attrs = (static_cast<std::uint32_t>(raw[0]) << 24) |
        (static_cast<std::uint32_t>(raw[1]) << 16) |
        (static_cast<std::uint32_t>(raw[2]) << 8) |
        static_cast<std::uint32_t>(raw[3]);
    attrs |= kFileAttributeArchive;

    raw[0] = static_cast<unsigned char>((attrs >> 24) & 0xFF);
    raw[1] = static_cast<unsigned char>((attrs >> 16) & 0xFF);
    raw[2] = static_cast<unsigned char>((attrs >> 8) & 0xFF);
    raw[3] = static_cast<unsigned char>(attrs & 0xFF);

    if (setxattr(real.c_str(), kNtfsAttribName, raw.data(), raw.size(), 0) != 0) {
        error = std::string("setxattr ") + kNtfsAttribName + " failed: " + std::strerror(errno);
        return false;
    }
    return true;
}

#elif defined(_WIN32)

bool try_set_archive_bit(const std::filesystem::path& path, std::string& error) {
    const DWORD attrs = GetFileAttributesW(path.c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES) {
        error = "GetFileAttributesW failed: " +
            std::system_category().message(static_cast<int>(GetLastError()));
        return false;
    }
    if (!SetFileAttributesW(path.c_str(), attrs | FILE_ATTRIBUTE_ARCHIVE)) {
        error = "SetFileAttributesW failed: " +
            std::system_category().message(static_cast<int>(GetLastError()));
        return false;
    }
    return true;
}

#else

bool try_set_archive_bit(const std::filesystem::path& /*path*/, std::string& error) {
    error = "setting the archive bit is not supported on this platform";
    return false;
}

#endif

}  // namespace nsp_split
