#include "common/Digest.h"

#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rebalex {
namespace utils {

std::string Digest::sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256_digest_failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace utils
} // namespace rebalex
