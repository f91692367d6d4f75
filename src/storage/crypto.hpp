#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tabula::storage {

/**
 * AES-256-GCM wrapper for table snapshots.
 *
 * Output of encrypt() is [12-byte nonce][ciphertext][16-byte tag]. A fresh
 * random nonce is drawn for every call. decrypt() either returns the exact
 * plaintext or throws StoreError(ENCRYPTION); a wrong key and a tampered
 * buffer are indistinguishable.
 *
 * Immutable after construction, so one instance can be shared by every
 * table of a store.
 */
class Crypto {
public:
    static constexpr size_t kKeySize = 32;
    static constexpr size_t kNonceSize = 12;
    static constexpr size_t kTagSize = 16;

    // Throws StoreError(ENCRYPTION) unless key is exactly kKeySize bytes.
    explicit Crypto(const std::vector<uint8_t>& key);
    ~Crypto();

    Crypto(const Crypto&) = delete;
    Crypto& operator=(const Crypto&) = delete;

    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) const;
    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& buffer) const;

    // kKeySize bytes from the OpenSSL CSPRNG.
    static std::vector<uint8_t> generate_key();

    // 64 lowercase hex characters.
    static std::string key_to_hex(const std::vector<uint8_t>& key);

    // Throws StoreError(CONFIG) on odd length or non-hex characters.
    static std::vector<uint8_t> key_from_hex(const std::string& hex);

private:
    std::vector<uint8_t> key_;
};

} // namespace tabula::storage
