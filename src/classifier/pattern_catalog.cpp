#include "classifier/pattern_catalog.hpp"

#include <iterator>

namespace docshield {

PatternCatalog::PatternCatalog(std::vector<Entry> entries)
    : entries_(std::move(entries)) {}

PatternCatalog PatternCatalog::default_catalog() {
    std::vector<Entry> entries;
    entries.reserve(kAllEntityCategories.size());

    // Compiled once per catalog; every anonymize() call reuses them.
    // A literal '-' always leads its bracket expression.

    entries.push_back({EntityCategory::EMAIL_ADDRESS, std::regex(
        R"([-a-zA-Z0-9_.+]+@[-a-zA-Z0-9]+\.[-a-zA-Z0-9.]+)")});

    // Optional country code, optional area code (bracketed or bare), 6-8 digit body
    entries.push_back({EntityCategory::PHONE_NUMBER, std::regex(
        R"((?:(?:\+?\d{1,3}[-\s.]?)?(?:\(\d{2,4}\)[-\s.]?|\d{2,4}[-\s.])?\d{3,4}[-\s.]?\d{3,4}))")});

    // '$' matches only at the very end here; a final newline still ends the text
    entries.push_back({EntityCategory::IP_ADDRESS, std::regex(
        R"(\b(?:(?:25[0-5]|2[0-4]\d|[01]?\d?\d)(?:\.|(?=\n?$))){4}\b)")});

    // 13-19 digits with optional space/hyphen separators, no Luhn check
    entries.push_back({EntityCategory::CREDIT_CARD, std::regex(
        R"(\b(?:\d[- ]*?){13,19}\b)")});

    entries.push_back({EntityCategory::SSN, std::regex(
        R"(\b\d{3}-\d{2}-\d{4}\b)")});

    // d/m/y, m-d-yy and ISO-style y-m-d
    entries.push_back({EntityCategory::DATE, std::regex(
        R"(\b(?:\d{1,2}[-/]\d{1,2}[-/]\d{2,4}|\d{4}[-/]\d{1,2}[-/]\d{1,2})\b)")});

    return PatternCatalog(std::move(entries));
}

std::vector<PatternMatch> PatternCatalog::find_all(std::string_view text) const {
    std::vector<PatternMatch> matches;
    if (text.empty()) {
        return matches;
    }

    for (size_t idx = 0; idx < entries_.size(); ++idx) {
        const auto& entry = entries_[idx];
        auto it = std::cregex_iterator(text.data(), text.data() + text.size(), entry.pattern);
        const auto end = std::cregex_iterator();

        for (; it != end; ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;
            const auto begin = static_cast<size_t>(m.position(0));
            matches.push_back(PatternMatch{
                entry.category,
                idx,
                begin,
                begin + static_cast<size_t>(m.length(0))
            });
        }
    }

    return matches;
}

std::vector<EntityCategory> PatternCatalog::categories() const {
    std::vector<EntityCategory> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.category);
    }
    return out;
}

} // namespace docshield
