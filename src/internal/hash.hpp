#pragma once

#include "litmus/format.hpp"

#include <openssl/evp.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace litmus::internal {

    using namespace litmus::literals;
    using namespace std::string_view_literals;

    class evp_md_ctx {
      public:
        evp_md_ctx() : ctx_{EVP_MD_CTX_new()} {}
        ~evp_md_ctx() {
            if (ctx_ != nullptr) {
                EVP_MD_CTX_free(ctx_);
            }
        }

        evp_md_ctx(const evp_md_ctx&) = delete;
        evp_md_ctx& operator=(const evp_md_ctx&) = delete;

        EVP_MD_CTX* get() { return ctx_; }
        explicit operator bool() const { return ctx_ != nullptr; }

      private:
        EVP_MD_CTX* ctx_{nullptr};
    };

    inline std::string bytes_to_hex(const unsigned char* data, std::size_t len) {
        static constexpr auto hex_chars = "0123456789abcdef"sv;
        std::string out{};
        out.reserve(len * 2U);
        for (std::size_t i = 0U; i < len; ++i) {
            out.push_back(hex_chars[(data[i] >> 4U) & 0x0FU]);
            out.push_back(hex_chars[data[i] & 0x0FU]);
        }
        return out;
    }

    inline std::string sha256_file(const std::filesystem::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {} for hashing"_format(path.string()));
        }

        evp_md_ctx ctx{};
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("sha256 init failed");
        }

        char buffer[8192];
        while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(in.gcount())) != 1) {
                throw std::runtime_error("sha256 update failed for {}"_format(path.string()));
            }
        }
        if (in.bad()) {
            throw std::runtime_error("failed to read {} for hashing"_format(path.string()));
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0U;
        if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
            throw std::runtime_error("sha256 finalize failed for {}"_format(path.string()));
        }
        return bytes_to_hex(digest, digest_len);
    }

}  // namespace litmus::internal
