#pragma once

#include "core/types.hpp"
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace docshield {

/**
 * @brief A raw regex hit, in byte offsets of the scanned text
 *
 * `catalog_index` is the position of the producing entry in the catalog and
 * is what keeps ordering stable when two categories hit the same offset.
 */
struct PatternMatch {
    EntityCategory category;
    size_t catalog_index;
    size_t begin;
    size_t end;
};

/**
 * @brief Ordered, immutable list of PII matchers
 *
 * Each entry scans the text independently: within one entry matches never
 * overlap, across entries they may. Iteration order is the construction
 * order and never changes, which keeps token streams reproducible.
 *
 * Default entries (in order):
 * 1. EMAIL_ADDRESS
 * 2. PHONE_NUMBER
 * 3. IP_ADDRESS
 * 4. CREDIT_CARD
 * 5. SSN
 * 6. DATE
 */
class PatternCatalog {
public:
    struct Entry {
        EntityCategory category;
        std::regex pattern;
    };

    explicit PatternCatalog(std::vector<Entry> entries);

    /**
     * @brief Catalog with the standard six categories
     */
    [[nodiscard]] static PatternCatalog default_catalog();

    /**
     * @brief Run every entry over `text`
     * @return Matches grouped by entry in catalog order, each group left to right
     */
    [[nodiscard]] std::vector<PatternMatch> find_all(std::string_view text) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] std::vector<EntityCategory> categories() const;

private:
    std::vector<Entry> entries_;
};

} // namespace docshield
