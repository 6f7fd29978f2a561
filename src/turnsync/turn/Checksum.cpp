#include "turn/Checksum.hpp"

#include "core/ValueJson.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace TS::Checksum {

auto digestHex(std::string_view bytes) -> Expected<std::string> {
    unsigned int  length = 0;
    unsigned char digest[EVP_MAX_MD_SIZE];
    if (EVP_Digest(bytes.data(), bytes.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        return std::unexpected(Error{Error::Code::UnknownError, "failed to compute sha256 digest"});
    }
    std::ostringstream oss;
    for (unsigned int idx = 0; idx < length; ++idx) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[idx]);
    }
    return oss.str();
}

auto compute(Value const& state) -> Expected<std::string> {
    auto hex = digestHex(canonicalJson(state));
    if (!hex) {
        return std::unexpected(hex.error());
    }
    return std::string(kPrefix) + *hex;
}

auto matches(Value const& state, std::string_view expected) -> Expected<bool> {
    auto actual = compute(state);
    if (!actual) {
        return std::unexpected(actual.error());
    }
    return *actual == expected;
}

} // namespace TS::Checksum
