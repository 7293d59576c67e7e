// id_generator.cpp - UUID generation backed by OpenSSL
#include "core/id_generator.h"
#include <openssl/rand.h>
#include <iomanip>
#include <random>
#include <sstream>

namespace coderoom::server::core {

std::string GenerateUUID() {
    unsigned char uuid_bytes[16];
    if (RAND_bytes(uuid_bytes, 16) != 1) {
        // Fallback
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<unsigned int> dist(0, 255);
        for (int i = 0; i < 16; ++i) {
            uuid_bytes[i] = static_cast<unsigned char>(dist(gen));
        }
    }

    uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;  // Version 4
    uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;  // Variant 1

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(uuid_bytes[i]);
    }
    return oss.str();
}

} // namespace coderoom::server::core
