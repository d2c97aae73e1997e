#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <wildsort/core/errors.hpp>
#include <wildsort/core/types.hpp>
#include <wildsort/config/taxonomy.hpp>
#include <wildsort/routing/filesystem.hpp>

namespace wildsort {

namespace buckets {
    inline const std::string sorted = "Sorted";
    inline const std::string unsorted = "Unsorted";
    inline const std::string no_animal = "No_Animal";
    inline const std::string other = "Other";
}

struct routing_decision {
    std::optional<std::string> category;
    std::optional<std::string> species;
    std::filesystem::path destination;   // directory the file is moved into
};

// Turns a label into one path component that stays inside its parent directory.
inline std::string safe_component(const std::string &name)
{
    if (name.empty() || name == "." || name == "..")
        return "_";

    std::string safe(name);
    for (char &c : safe) {
        if (c == '/' || c == '\\' || c == '\0')
            c = '_';
    }

    return safe;
}

class taxonomy_resolver {
public:
    taxonomy_resolver(taxonomy tax, std::filesystem::path outputRoot,
                      std::shared_ptr<file_system> fs = nullptr);

    /**
     * Maps a label to its destination directory under the output root.
     * An unmapped species goes to Sorted/Other/<species>, which is created here
     * (idempotently). Throws move_failed when that directory cannot be created.
     */
    routing_decision resolve(const classification_label &label) const;

    const taxonomy &tax() const;
    const std::filesystem::path &output_root() const;
    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    taxonomy m_taxonomy;
    std::filesystem::path m_output_root;
    std::shared_ptr<file_system> m_fs;
    std::shared_ptr<spdlog::logger> m_logger;
};

// Definitions

inline taxonomy_resolver::taxonomy_resolver(taxonomy tax, std::filesystem::path outputRoot,
                                            std::shared_ptr<file_system> fs)
    : m_taxonomy(std::move(tax))
    , m_output_root(std::move(outputRoot))
    , m_fs(fs)
    , m_logger(spdlog::default_logger()->clone("wildsort.resolver"))
{
    if (!m_fs)
        m_fs = std::make_shared<local_file_system>();
}

inline routing_decision taxonomy_resolver::resolve(const classification_label &label) const
{
    routing_decision decision;

    switch (label.kind()) {
    case classification_label::NoAnimal:
        decision.destination = m_output_root / buckets::no_animal;
        return decision;
    case classification_label::Unsorted:
        decision.destination = m_output_root / buckets::unsorted;
        return decision;
    case classification_label::Species:
    default:
        break;
    }

    const std::string &species = label.species_name();
    decision.species = species;

    if (auto category = m_taxonomy.category_of(species)) {
        decision.category = category;
        decision.destination = m_output_root / buckets::sorted / safe_component(*category) / safe_component(species);
        return decision;
    }

    decision.category = buckets::other;
    decision.destination = m_output_root / buckets::sorted / buckets::other / safe_component(species);

    try {
        if (m_fs->create_directories(decision.destination))
            m_logger->info("Species '{}' is not in the taxonomy, created {}", species, decision.destination.string());
    } catch (const std::filesystem::filesystem_error &e) {
        throw move_failed(fmt::format("Could not create {}: {}", decision.destination.string(), e.what()));
    }

    return decision;
}

inline const taxonomy &taxonomy_resolver::tax() const
{
    return m_taxonomy;
}

inline const std::filesystem::path &taxonomy_resolver::output_root() const
{
    return m_output_root;
}

inline void taxonomy_resolver::set_logger(std::shared_ptr<spdlog::logger> logger)
{
    m_logger = logger;
}

}
