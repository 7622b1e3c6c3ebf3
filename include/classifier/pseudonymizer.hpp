#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace docshield {

/**
 * @brief Deterministic keyed pseudonymization of PII values
 *
 * token = "<" + CATEGORY + ":" + hex(HMAC-SHA256(secret, CATEGORY + "::" + value))[0:16] + ">"
 *
 * The token is a pure function of (secret, category, value), has a fixed
 * length per category and cannot be reversed without the secret.
 */
class Pseudonymizer {
public:
    static constexpr size_t kDigestHexChars = 16;

    /**
     * @throws std::invalid_argument if secret_key is empty
     */
    explicit Pseudonymizer(std::string secret_key);

    [[nodiscard]] std::string token(EntityCategory category, std::string_view raw_value) const;

    /**
     * @brief Stateless form, usable for any category label
     */
    [[nodiscard]] static std::string token(
        std::string_view secret_key,
        std::string_view category,
        std::string_view raw_value);

private:
    std::string secret_key_;
};

} // namespace docshield
