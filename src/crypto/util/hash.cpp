#include "crypto/util/hash.hpp"
#include "logging/LogRegistry.hpp"

#include <sodium.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <system_error>

using namespace dd::logging;

namespace dd::crypto::hash {

namespace {

void ensureSodium() {
    static const int rc = sodium_init();
    if (rc < 0) throw std::runtime_error("libsodium failed to initialize");
}

}

std::string blake2b(const std::filesystem::path& filepath) {
    ensureSodium();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    errno = 0;
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        const int err = errno ? errno : EIO;
        LogRegistry::crypto()->debug("[hash] Cannot open {}: {}", filepath.string(), std::generic_category().message(err));
        throw std::system_error(err, std::generic_category(), "Failed to open file for hashing: " + filepath.string());
    }

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, hash_len);

    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        crypto_generichash_update(&state, reinterpret_cast<unsigned char*>(buffer), file.gcount());
    }

    // eof ends the loop normally; badbit means the read itself failed
    if (file.bad()) {
        const int err = errno ? errno : EIO;
        throw std::system_error(err, std::generic_category(), "Failed to read file for hashing: " + filepath.string());
    }

    crypto_generichash_final(&state, hash, hash_len);
    LogRegistry::crypto()->trace("[hash] Hashed {}", filepath.string());

    std::ostringstream result;
    for (size_t i = 0; i < hash_len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];

    return result.str();
}

}
