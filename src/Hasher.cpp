#include "stlmeta/Hasher.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace stlmeta {

    Hasher::Hasher() : ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
        if (!ctx) {
            throw std::runtime_error("Failed to create hash context");
        }
        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize SHA256 hash");
        }
    }

    void Hasher::update(std::string_view data) {
        if (finished) {
            throw std::runtime_error("Hash already finalized");
        }
        if (data.empty()) {
            return;
        }
        if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error("Failed to update hash");
        }
    }

    std::string Hasher::hexdigest() {
        if (finished) {
            throw std::runtime_error("Hash already finalized");
        }
        finished = true;

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
            throw std::runtime_error("Failed to finalize hash");
        }

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

    std::string Hasher::sha256(std::string_view data) {
        Hasher hasher;
        hasher.update(data);
        return hasher.hexdigest();
    }

} // namespace stlmeta
