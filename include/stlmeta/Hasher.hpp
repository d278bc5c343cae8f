#pragma once
#include <openssl/evp.h>
#include <memory>
#include <string>
#include <string_view>

namespace stlmeta {

    // Incremental SHA-256 over bytes handed in by the caller
    class Hasher {
    public:
        Hasher();

        void update(std::string_view data);

        // Finalizes the digest; further update or hexdigest calls throw
        std::string hexdigest();

        static std::string sha256(std::string_view data);

    private:
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx;
        bool finished = false;
    };

} // namespace stlmeta
