#include "storage/crypto.hpp"
#include "storage/error.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <climits>
#include <memory>

namespace tabula::storage {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtx new_cipher_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw StoreError(ErrorCode::ENCRYPTION, "failed to allocate cipher context");
    }
    return ctx;
}

void random_fill(uint8_t* out, size_t n) {
    if (RAND_bytes(out, static_cast<int>(n)) != 1) {
        throw StoreError(ErrorCode::ENCRYPTION, "RAND_bytes failed");
    }
}

[[noreturn]] void fail(const char* what) {
    ERR_clear_error();
    throw StoreError(ErrorCode::ENCRYPTION, what);
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Crypto::Crypto(const std::vector<uint8_t>& key) {
    if (key.size() != kKeySize) {
        throw StoreError(ErrorCode::ENCRYPTION,
                         "encryption key must be " + std::to_string(kKeySize) +
                         " bytes, got " + std::to_string(key.size()));
    }
    key_ = key;
}

Crypto::~Crypto() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

std::vector<uint8_t> Crypto::encrypt(const std::vector<uint8_t>& plaintext) const {
    if (plaintext.size() > static_cast<size_t>(INT_MAX)) {
        throw StoreError(ErrorCode::ENCRYPTION, "plaintext too large");
    }

    std::vector<uint8_t> out(kNonceSize + plaintext.size() + kTagSize);
    uint8_t* nonce = out.data();
    uint8_t* ciphertext = out.data() + kNonceSize;
    random_fill(nonce, kNonceSize);

    auto ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        fail("EncryptInit failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) {
        fail("failed to set GCM nonce length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        fail("EncryptInit key/nonce failed");
    }

    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            fail("EncryptUpdate failed");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + total, &len) != 1) {
        fail("EncryptFinal failed");
    }
    total += len;

    uint8_t* tag = ciphertext + total;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag) != 1) {
        fail("failed to read GCM tag");
    }

    out.resize(kNonceSize + static_cast<size_t>(total) + kTagSize);
    return out;
}

std::vector<uint8_t> Crypto::decrypt(const std::vector<uint8_t>& buffer) const {
    if (buffer.size() < kNonceSize + kTagSize) {
        throw StoreError(ErrorCode::ENCRYPTION,
                         "encrypted payload too short: " + std::to_string(buffer.size()) + " bytes");
    }

    const uint8_t* nonce = buffer.data();
    const uint8_t* ciphertext = buffer.data() + kNonceSize;
    size_t ciphertext_len = buffer.size() - kNonceSize - kTagSize;
    if (ciphertext_len > static_cast<size_t>(INT_MAX)) {
        throw StoreError(ErrorCode::ENCRYPTION, "ciphertext too large");
    }
    std::vector<uint8_t> tag(buffer.end() - kTagSize, buffer.end());

    auto ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        fail("DecryptInit failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1) {
        fail("failed to set GCM nonce length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        fail("DecryptInit key/nonce failed");
    }

    std::vector<uint8_t> plaintext(ciphertext_len + kTagSize);
    int len = 0;
    int total = 0;
    if (ciphertext_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext, static_cast<int>(ciphertext_len)) != 1) {
            fail("DecryptUpdate failed");
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        fail("failed to set GCM tag");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        fail("authentication failed: wrong key or corrupted data");
    }
    total += len;

    plaintext.resize(static_cast<size_t>(total));
    return plaintext;
}

std::vector<uint8_t> Crypto::generate_key() {
    std::vector<uint8_t> key(kKeySize);
    random_fill(key.data(), key.size());
    return key;
}

std::string Crypto::key_to_hex(const std::vector<uint8_t>& key) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(key.size() * 2);
    for (uint8_t b : key) {
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0x0F]);
    }
    return hex;
}

std::vector<uint8_t> Crypto::key_from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw StoreError(ErrorCode::CONFIG, "hex key has odd length");
    }

    std::vector<uint8_t> key;
    key.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw StoreError(ErrorCode::CONFIG, "hex key contains non-hex characters");
        }
        key.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return key;
}

} // namespace tabula::storage
