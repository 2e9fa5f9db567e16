#include "srcfmt/core/digest.hpp"
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace srcfmt::digest {

auto sha512_hex(std::string_view bytes) -> std::string {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(),
                                                                   &EVP_MD_CTX_free);
    if (!context) {
        throw std::runtime_error("Cannot allocate SHA-512 context");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_length = 0;

    if (EVP_DigestInit_ex(context.get(), EVP_sha512(), nullptr) != 1
        || EVP_DigestUpdate(context.get(), bytes.data(), bytes.size()) != 1
        || EVP_DigestFinal_ex(context.get(), hash.data(), &hash_length) != 1) {
        throw std::runtime_error("SHA-512 computation failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

auto is_hex_digest(std::string_view text) -> bool {
    if (text.size() != hex_length) {
        return false;
    }
    return text.find_first_not_of("0123456789abcdef") == std::string_view::npos;
}

} // namespace srcfmt::digest
