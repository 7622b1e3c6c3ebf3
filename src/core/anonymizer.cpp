#include "core/anonymizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace docshield {

namespace {

bool spans_overlap(const PatternMatch& a, const PatternMatch& b) {
    return a.begin < b.end && b.begin < a.end;
}

/**
 * @brief Maps byte offsets of `text` to code point offsets
 *
 * Pure ASCII text maps every offset to itself, so no table is built.
 */
class CharOffsetMap {
public:
    explicit CharOffsetMap(std::string_view text) {
        const bool ascii = std::all_of(text.begin(), text.end(), [](char c) {
            return static_cast<unsigned char>(c) < 0x80;
        });
        if (ascii) return;

        // table_[i] = number of code points that start before byte i
        table_.resize(text.size() + 1);
        table_[0] = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            const bool starts_char = !utils::is_utf8_continuation(static_cast<unsigned char>(text[i]));
            table_[i + 1] = table_[i] + (starts_char ? 1 : 0);
        }
    }

    [[nodiscard]] size_t operator()(size_t byte_offset) const {
        return table_.empty() ? byte_offset : table_[byte_offset];
    }

private:
    std::vector<size_t> table_;
};

} // anonymous namespace

const char* overlap_policy_to_string(OverlapPolicy policy) {
    switch (policy) {
        case OverlapPolicy::APPLY_ALL:      return "apply_all";
        case OverlapPolicy::LONGEST_MATCH:  return "longest_match";
        case OverlapPolicy::FIRST_CATEGORY: return "first_category";
    }
    return "apply_all";
}

std::optional<OverlapPolicy> overlap_policy_from_string(std::string_view name) {
    const std::string lower = utils::to_lower(std::string(name));
    if (lower == "apply_all") return OverlapPolicy::APPLY_ALL;
    if (lower == "longest_match") return OverlapPolicy::LONGEST_MATCH;
    if (lower == "first_category") return OverlapPolicy::FIRST_CATEGORY;
    return std::nullopt;
}

AnonymizationEngine::AnonymizationEngine(
    PatternCatalog catalog,
    Pseudonymizer pseudonymizer,
    OverlapPolicy policy)
    : catalog_(std::move(catalog)),
      pseudonymizer_(std::move(pseudonymizer)),
      policy_(policy) {}

AnonymizationResult AnonymizationEngine::anonymize(std::string_view text) const {
    AnonymizationResult result;
    if (text.empty()) {
        return result;
    }

    auto matches = resolve_overlaps(catalog_.find_all(text));
    if (matches.empty()) {
        result.text = std::string(text);
        return result;
    }

    // Highest start first so lower offsets stay valid while substituting.
    // Equal starts keep catalog order.
    std::vector<PatternMatch> by_start_desc = matches;
    std::stable_sort(by_start_desc.begin(), by_start_desc.end(),
        [](const PatternMatch& a, const PatternMatch& b) { return a.begin > b.begin; });

    std::string out(text);
    for (const auto& m : by_start_desc) {
        const auto token = pseudonymizer_.token(m.category, text.substr(m.begin, m.end - m.begin));
        // Overlapping spans may point past the rewritten text; clamp like slicing does
        const size_t s = std::min(m.begin, out.size());
        const size_t e = std::max(s, std::min(m.end, out.size()));
        out.replace(s, e - s, token);
    }
    result.text = std::move(out);

    std::stable_sort(matches.begin(), matches.end(),
        [](const PatternMatch& a, const PatternMatch& b) { return a.begin < b.begin; });

    const CharOffsetMap to_chars(text);
    result.entities.reserve(matches.size());
    for (const auto& m : matches) {
        result.entities.push_back(EntityMatch{m.category, to_chars(m.begin), to_chars(m.end)});
    }
    return result;
}

std::vector<PatternMatch> AnonymizationEngine::resolve_overlaps(
    std::vector<PatternMatch> matches) const {

    if (policy_ == OverlapPolicy::APPLY_ALL || matches.size() < 2) {
        return matches;
    }

    // Rank candidates, accept greedily, then restore detection order
    std::vector<size_t> order(matches.size());
    std::iota(order.begin(), order.end(), size_t{0});

    if (policy_ == OverlapPolicy::LONGEST_MATCH) {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const auto& ma = matches[a];
            const auto& mb = matches[b];
            const size_t la = ma.end - ma.begin;
            const size_t lb = mb.end - mb.begin;
            if (la != lb) return la > lb;
            if (ma.begin != mb.begin) return ma.begin < mb.begin;
            return ma.catalog_index < mb.catalog_index;
        });
    } else {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const auto& ma = matches[a];
            const auto& mb = matches[b];
            if (ma.catalog_index != mb.catalog_index) return ma.catalog_index < mb.catalog_index;
            return ma.begin < mb.begin;
        });
    }

    std::vector<size_t> accepted;
    for (const size_t idx : order) {
        const bool clashes = std::any_of(accepted.begin(), accepted.end(), [&](size_t kept) {
            return spans_overlap(matches[idx], matches[kept]);
        });
        if (!clashes) {
            accepted.push_back(idx);
        }
    }
    std::sort(accepted.begin(), accepted.end());

    std::vector<PatternMatch> resolved;
    resolved.reserve(accepted.size());
    for (const size_t idx : accepted) {
        resolved.push_back(matches[idx]);
    }

    if (resolved.size() != matches.size()) {
        utils::log::debug(std::format("Overlap policy {} dropped {} of {} detections",
            overlap_policy_to_string(policy_), matches.size() - resolved.size(), matches.size()));
    }
    return resolved;
}

} // namespace docshield
