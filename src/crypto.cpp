#include "mqttident/crypto.hpp"

#include "string_util.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>

namespace mqttident {
namespace crypto {

namespace {

constexpr const char* kBase32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

std::string openssl_error(const char* what) {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return what;
    }
    char err_buf[256];
    ERR_error_string_n(err, err_buf, sizeof(err_buf));
    return std::string(what) + ": " + err_buf;
}

/// Validate inputs and assemble the hashed content
Result<std::string> token_content(const std::string& seed, int length,
                                  const std::optional<std::string>& ns) {
    std::string trimmed_seed = detail::trim(seed);
    if (trimmed_seed.empty()) {
        return Result<std::string>::error(ErrorCode::InvalidInput, "seed must not be empty");
    }
    if (length < 1) {
        return Result<std::string>::error(ErrorCode::InvalidInput, "length must be positive");
    }
    if (!ns) {
        return Result<std::string>::ok(trimmed_seed);
    }

    std::string trimmed_ns = detail::trim(*ns);
    if (trimmed_ns.empty()) {
        return Result<std::string>::error(ErrorCode::InvalidInput, "namespace must not be empty");
    }
    return Result<std::string>::ok(trimmed_ns + SEED_SEPARATOR + trimmed_seed);
}

size_t ceil_div(size_t numerator, size_t denominator) {
    return (numerator + denominator - 1) / denominator;
}

}  // namespace

// ==================== Encoding ====================

std::string base32_encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve(ceil_div(data.size(), 5) * 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            result.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1f]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        result.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1f]);
    }

    while (result.size() % 8 != 0) {
        result.push_back('=');
    }
    return result;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    std::unique_ptr<BIO, decltype(&BIO_free_all)> b64(BIO_new(BIO_f_base64()), BIO_free_all);
    if (!b64) {
        return "";
    }
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    BIO* bmem = BIO_new(BIO_s_mem());
    if (bmem == nullptr) {
        return "";
    }
    BIO_push(b64.get(), bmem);

    if (BIO_write(b64.get(), data.data(), static_cast<int>(data.size())) <= 0 ||
        BIO_flush(b64.get()) != 1) {
        return "";
    }

    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64.get(), &bptr);
    if (bptr == nullptr) {
        return "";
    }
    return std::string(bptr->data, bptr->length);
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string encoded = base64_encode(data);

    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');

    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

// ==================== Digest ====================

Result<std::vector<uint8_t>> shake256(const std::string& data, size_t output_size) {
    using Bytes = std::vector<uint8_t>;

    if (output_size == 0) {
        return Result<Bytes>::error(ErrorCode::InvalidInput, "digest size must be positive");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return Result<Bytes>::error(ErrorCode::DigestError, "Failed to create digest context");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_shake256(), nullptr) != 1) {
        return Result<Bytes>::error(ErrorCode::DigestError,
                                    openssl_error("Failed to initialize SHAKE256"));
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return Result<Bytes>::error(ErrorCode::DigestError, openssl_error("Digest update failed"));
    }

    Bytes digest(output_size);
    if (EVP_DigestFinalXOF(ctx.get(), digest.data(), digest.size()) != 1) {
        return Result<Bytes>::error(ErrorCode::DigestError, openssl_error("Digest finalize failed"));
    }
    return Result<Bytes>::ok(std::move(digest));
}

// ==================== Tokens ====================

Result<std::string> build_compact_token(const std::string& seed, int length,
                                        const std::optional<std::string>& ns) {
    auto content = token_content(seed, length, ns);
    if (content.is_error()) {
        return content;
    }

    // 5 bits per base-32 character, never below 128 bits of digest
    size_t digest_size = std::max<size_t>(16, ceil_div(static_cast<size_t>(length) * 5, 8));
    auto digest = shake256(content.value(), digest_size);
    if (digest.is_error()) {
        return Result<std::string>::propagate(digest);
    }

    std::string token = detail::to_lower(base32_encode(digest.value()));
    token.erase(std::remove(token.begin(), token.end(), '='), token.end());
    token.resize(std::min(token.size(), static_cast<size_t>(length)));
    return Result<std::string>::ok(std::move(token));
}

Result<std::string> build_urlsafe_token(const std::string& seed, int length,
                                        const std::optional<std::string>& ns) {
    auto content = token_content(seed, length, ns);
    if (content.is_error()) {
        return content;
    }

    size_t digest_size = std::max<size_t>(24, ceil_div(static_cast<size_t>(length) * 3, 4));
    auto digest = shake256(content.value(), digest_size);
    if (digest.is_error()) {
        return Result<std::string>::propagate(digest);
    }

    std::string token = base64url_encode(digest.value());
    if (token.empty()) {
        return Result<std::string>::error(ErrorCode::DigestError, "Base64 encoding failed");
    }
    token.resize(std::min(token.size(), static_cast<size_t>(length)));
    return Result<std::string>::ok(std::move(token));
}

}  // namespace crypto
}  // namespace mqttident
