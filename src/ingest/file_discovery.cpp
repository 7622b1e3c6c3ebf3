#include "ingest/file_discovery.hpp"
#include "extract/extractor_registry.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <unordered_set>

namespace docshield {

namespace {
constexpr size_t kHashBufferSize = 1024 * 1024;

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
} // anonymous namespace

std::vector<std::filesystem::path> discover_input_files(const std::filesystem::path& input) {
    namespace fs = std::filesystem;
    std::vector<fs::path> results;

    std::error_code ec;
    if (fs::is_regular_file(input, ec)) {
        results.push_back(input);
        return results;
    }
    if (!fs::is_directory(input, ec)) {
        utils::log::warn(std::format("Input path does not exist: {}", input.string()));
        return results;
    }

    auto it = fs::recursive_directory_iterator(
        input, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot read directory {}: {}", input.string(), ec.message()));
        return results;
    }
    for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            utils::log::warn(std::format("Directory walk under {} stopped early: {}",
                input.string(), ec.message()));
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && ExtractorRegistry::is_supported_extension(it->path())) {
            results.push_back(it->path());
        }
    }

    std::sort(results.begin(), results.end());
    return results;
}

std::vector<std::filesystem::path> discover_input_files(
    const std::vector<std::filesystem::path>& inputs) {
    std::vector<std::filesystem::path> results;
    std::unordered_set<std::string> seen;

    for (const auto& input : inputs) {
        for (auto& path : discover_input_files(input)) {
            if (seen.insert(path.lexically_normal().string()).second) {
                results.push_back(std::move(path));
            }
        }
    }
    return results;
}

std::string compute_file_sha256(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file for hashing: " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 initialization failed");
    }

    std::vector<char> buffer(kHashBufferSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error while hashing " + path.string());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    return utils::bytes_to_hex(digest, len);
}

} // namespace docshield
