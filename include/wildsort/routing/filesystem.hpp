#pragma once

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <system_error>

#include <unistd.h>

namespace wildsort {

// Blocking file operations used by routing. Failures throw std::filesystem::filesystem_error.
class file_system {
public:
    virtual ~file_system() = default;

    virtual bool exists(const std::filesystem::path &path) const = 0;
    virtual bool is_directory(const std::filesystem::path &path) const = 0;
    // Returns true when at least one directory was created, false when it already existed.
    virtual bool create_directories(const std::filesystem::path &path) = 0;
    // Never replaces `to`: an existing target fails with std::errc::file_exists.
    virtual void rename(const std::filesystem::path &from, const std::filesystem::path &to) = 0;
    // Never overwrites `to`.
    virtual void copy_file(const std::filesystem::path &from, const std::filesystem::path &to) = 0;
    virtual std::uintmax_t file_size(const std::filesystem::path &path) const = 0;
    virtual bool remove(const std::filesystem::path &path) = 0;
};

class local_file_system : public file_system {
public:
    bool exists(const std::filesystem::path &path) const override;
    bool is_directory(const std::filesystem::path &path) const override;
    bool create_directories(const std::filesystem::path &path) override;
    void rename(const std::filesystem::path &from, const std::filesystem::path &to) override;
    void copy_file(const std::filesystem::path &from, const std::filesystem::path &to) override;
    std::uintmax_t file_size(const std::filesystem::path &path) const override;
    bool remove(const std::filesystem::path &path) override;
};

// Definitions

inline bool local_file_system::exists(const std::filesystem::path &path) const
{
    return std::filesystem::exists(path);
}

inline bool local_file_system::is_directory(const std::filesystem::path &path) const
{
    return std::filesystem::is_directory(path);
}

inline bool local_file_system::create_directories(const std::filesystem::path &path)
{
    return std::filesystem::create_directories(path);
}

// link() fails with EEXIST instead of replacing the target, which rename() would do.
// Filesystems without hard links fall back to a checked rename.
inline void local_file_system::rename(const std::filesystem::path &from, const std::filesystem::path &to)
{
    if (::link(from.c_str(), to.c_str()) == 0) {
        if (::unlink(from.c_str()) != 0) {
            const std::error_code ec(errno, std::system_category());
            std::error_code rollback;
            std::filesystem::remove(to, rollback);
            throw std::filesystem::filesystem_error(rollback ? "unlink, second link left behind" : "unlink",
                                                    from, to, ec);
        }
        return;
    }

    const int link_errno = errno;
    if (link_errno != EPERM && link_errno != ENOTSUP && link_errno != EOPNOTSUPP && link_errno != EMLINK)
        throw std::filesystem::filesystem_error("link", from, to, std::error_code(link_errno, std::system_category()));

    if (std::filesystem::exists(to))
        throw std::filesystem::filesystem_error("rename", from, to, std::make_error_code(std::errc::file_exists));

    std::filesystem::rename(from, to);
}

inline void local_file_system::copy_file(const std::filesystem::path &from, const std::filesystem::path &to)
{
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::none);
}

inline std::uintmax_t local_file_system::file_size(const std::filesystem::path &path) const
{
    return std::filesystem::file_size(path);
}

inline bool local_file_system::remove(const std::filesystem::path &path)
{
    return std::filesystem::remove(path);
}

}
