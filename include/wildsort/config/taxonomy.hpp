#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wildsort {

// Two-level grouping (category -> species). Categories keep insertion order, which is
// the order species lookups search them in.
class taxonomy {
public:
    struct category {
        std::string name;
        std::vector<std::string> species;
    };

    taxonomy() = default;

    void add_category(std::string name, std::vector<std::string> species);

    std::optional<std::string> category_of(const std::string &species) const;

    // Species listed under more than one category, in first-seen order.
    std::vector<std::string> duplicate_species() const;

    const std::vector<category> &categories() const;
    std::size_t species_count() const;
    bool empty() const;

private:
    std::vector<category> m_categories;
};

// Definitions

inline void taxonomy::add_category(std::string name, std::vector<std::string> species)
{
    auto it = std::find_if(m_categories.begin(), m_categories.end(),
                           [&name](const category &c) { return c.name == name; });
    if (it != m_categories.end()) {
        for (auto &s : species) {
            if (std::find(it->species.begin(), it->species.end(), s) == it->species.end())
                it->species.emplace_back(std::move(s));
        }
        return;
    }

    m_categories.push_back({ std::move(name), std::move(species) });
}

inline std::optional<std::string> taxonomy::category_of(const std::string &species) const
{
    for (const auto &c : m_categories) {
        if (std::find(c.species.begin(), c.species.end(), species) != c.species.end())
            return c.name;
    }

    return std::nullopt;
}

inline std::vector<std::string> taxonomy::duplicate_species() const
{
    std::vector<std::string> seen, duplicates;
    for (const auto &c : m_categories) {
        for (const auto &s : c.species) {
            if (std::find(seen.begin(), seen.end(), s) == seen.end()) {
                seen.push_back(s);
            } else if (std::find(duplicates.begin(), duplicates.end(), s) == duplicates.end()) {
                duplicates.push_back(s);
            }
        }
    }

    return duplicates;
}

inline const std::vector<taxonomy::category> &taxonomy::categories() const
{
    return m_categories;
}

inline std::size_t taxonomy::species_count() const
{
    std::size_t count = 0;
    for (const auto &c : m_categories)
        count += c.species.size();

    return count;
}

inline bool taxonomy::empty() const
{
    return species_count() == 0;
}

}
