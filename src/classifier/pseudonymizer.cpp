#include "classifier/pseudonymizer.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <format>
#include <stdexcept>

namespace docshield {

Pseudonymizer::Pseudonymizer(std::string secret_key)
    : secret_key_(std::move(secret_key)) {
    if (secret_key_.empty()) {
        throw std::invalid_argument("Pseudonymizer: secret key must not be empty");
    }
}

std::string Pseudonymizer::token(EntityCategory category, std::string_view raw_value) const {
    return token(secret_key_, entity_category_to_string(category), raw_value);
}

std::string Pseudonymizer::token(
    std::string_view secret_key,
    std::string_view category,
    std::string_view raw_value) {

    std::string message;
    message.reserve(category.size() + 2 + raw_value.size());
    message.append(category);
    message.append("::");
    message.append(raw_value);

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    if (!HMAC(EVP_sha256(),
              secret_key.data(), static_cast<int>(secret_key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              mac, &mac_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    // 16 hex chars = first 8 bytes of the MAC
    const auto digest = utils::bytes_to_hex(mac, kDigestHexChars / 2);
    return std::format("<{}:{}>", category, digest);
}

} // namespace docshield
