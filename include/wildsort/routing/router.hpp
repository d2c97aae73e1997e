#pragma once

#include <filesystem>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <wildsort/core/errors.hpp>
#include <wildsort/routing/filesystem.hpp>
#include <wildsort/routing/taxonomyresolver.hpp>

namespace wildsort {

class router {
public:
    explicit router(std::shared_ptr<file_system> fs = nullptr);

    /**
     * Moves `source` into decision.destination under its own file name and returns the
     * new path. Never overwrites: an existing target throws destination_exists and leaves
     * the source untouched. Other failures throw move_failed.
     */
    std::filesystem::path route(const std::filesystem::path &source, const routing_decision &decision);

    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    void copy_verify_delete(const std::filesystem::path &source, const std::filesystem::path &target);

    std::shared_ptr<file_system> m_fs;
    std::shared_ptr<spdlog::logger> m_logger;
};

// Definitions

inline router::router(std::shared_ptr<file_system> fs)
    : m_fs(fs)
    , m_logger(spdlog::default_logger()->clone("wildsort.router"))
{
    if (!m_fs)
        m_fs = std::make_shared<local_file_system>();
}

inline std::filesystem::path router::route(const std::filesystem::path &source, const routing_decision &decision)
{
    if (!source.has_filename())
        throw move_failed(fmt::format("'{}' does not name a file", source.string()));

    const std::filesystem::path target = decision.destination / source.filename();

    try {
        if (!m_fs->exists(source))
            throw move_failed(fmt::format("Source {} does not exist", source.string()));

        if (m_fs->exists(target))
            throw destination_exists(fmt::format("{} already exists, refusing to overwrite", target.string()));

        if (m_fs->create_directories(decision.destination))
            m_logger->debug("Created {}", decision.destination.string());

        try {
            m_fs->rename(source, target);
        } catch (const std::filesystem::filesystem_error &e) {
            if (e.code() == std::errc::file_exists)
                throw destination_exists(fmt::format("{} appeared while routing, refusing to overwrite", target.string()));

            if (e.code() != std::errc::cross_device_link)
                throw;

            m_logger->debug("{} is on another filesystem, copying", target.string());
            copy_verify_delete(source, target);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        throw move_failed(fmt::format("Moving {} to {} failed: {}", source.string(), target.string(), e.what()));
    }

    m_logger->debug("Moved {} -> {}", source.string(), target.string());
    return target;
}

inline void router::copy_verify_delete(const std::filesystem::path &source, const std::filesystem::path &target)
{
    // Rolls back to the source-only state on any failure
    auto discard_copy = [this, &target]() {
        try {
            m_fs->remove(target);
        } catch (const std::filesystem::filesystem_error &e) {
            m_logger->error("Could not remove partial copy {}: {}", target.string(), e.what());
        }
    };

    try {
        m_fs->copy_file(source, target);

        if (m_fs->file_size(source) != m_fs->file_size(target)) {
            discard_copy();
            throw move_failed(fmt::format("Copy of {} to {} is incomplete", source.string(), target.string()));
        }

        m_fs->remove(source);
    } catch (const std::filesystem::filesystem_error &e) {
        if (e.code() == std::errc::file_exists)
            throw destination_exists(fmt::format("{} appeared while routing, refusing to overwrite", target.string()));

        discard_copy();
        throw;
    }
}

inline void router::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    m_logger = logger;
}

}
