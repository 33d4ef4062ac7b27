#include "base64.h"
#include <openssl/evp.h>
#include <vector>

std::string base64_encode(const std::string& input) {
    if (input.empty()) {
        return "";
    }

    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock appends
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));

    return std::string(reinterpret_cast<const char*>(out.data()), written);
}
