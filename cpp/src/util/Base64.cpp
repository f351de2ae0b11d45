#include "cvforge/util/Base64.hpp"

#include <openssl/evp.h>

namespace cvforge::util {

std::string base64Encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminating NUL.
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

} // namespace cvforge::util
