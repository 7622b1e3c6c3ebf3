#pragma once

#include "classifier/pattern_catalog.hpp"
#include "classifier/pseudonymizer.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docshield {

/**
 * @brief How overlapping detections from different categories are treated
 *
 * APPLY_ALL is the default: every detection is
 * substituted, even when spans overlap. The other policies are opt-in and
 * change the token stream for texts with overlapping detections.
 */
enum class OverlapPolicy {
    APPLY_ALL,       ///< keep every detection
    LONGEST_MATCH,   ///< longest span wins; ties go to lower start, then catalog order
    FIRST_CATEGORY   ///< earliest catalog category wins; ties go to lower start
};

[[nodiscard]] const char* overlap_policy_to_string(OverlapPolicy policy);
[[nodiscard]] std::optional<OverlapPolicy> overlap_policy_from_string(std::string_view name);

/**
 * @brief Detects PII spans and replaces them with pseudonymous tokens
 *
 * Algorithm:
 * 1. Run the catalog over the text (all categories, catalog order)
 * 2. Drop detections according to the overlap policy
 * 3. Substitute tokens by descending start offset; each substitution works
 *    on the already rewritten text with offsets clamped to its length
 * 4. Return entities sorted by ascending start (stable)
 *
 * Entity offsets are code points of the input text, not of the result.
 * The engine is immutable after construction and safe to share across
 * threads.
 */
class AnonymizationEngine {
public:
    AnonymizationEngine(
        PatternCatalog catalog,
        Pseudonymizer pseudonymizer,
        OverlapPolicy policy = OverlapPolicy::APPLY_ALL);

    [[nodiscard]] AnonymizationResult anonymize(std::string_view text) const;

    [[nodiscard]] const PatternCatalog& catalog() const { return catalog_; }
    [[nodiscard]] OverlapPolicy overlap_policy() const { return policy_; }

private:
    [[nodiscard]] std::vector<PatternMatch> resolve_overlaps(
        std::vector<PatternMatch> matches) const;

    PatternCatalog catalog_;
    Pseudonymizer pseudonymizer_;
    OverlapPolicy policy_;
};

} // namespace docshield
