#include <gtest/gtest.h>
#include "storage/crypto.hpp"
#include "storage/error.hpp"
#include <functional>

using namespace tabula::storage;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const StoreError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected StoreError";
    return ErrorCode::IO;
}

} // namespace

TEST(CryptoTest, RoundTrip) {
    Crypto crypto(Crypto::generate_key());
    auto plaintext = bytes_of("hello, table snapshot");

    auto sealed = crypto.encrypt(plaintext);
    EXPECT_EQ(sealed.size(), plaintext.size() + Crypto::kNonceSize + Crypto::kTagSize);
    EXPECT_EQ(crypto.decrypt(sealed), plaintext);
}

TEST(CryptoTest, EmptyPlaintextRoundTrips) {
    Crypto crypto(Crypto::generate_key());
    auto sealed = crypto.encrypt({});
    EXPECT_EQ(sealed.size(), Crypto::kNonceSize + Crypto::kTagSize);
    EXPECT_TRUE(crypto.decrypt(sealed).empty());
}

TEST(CryptoTest, FreshNonceEveryCall) {
    Crypto crypto(Crypto::generate_key());
    auto plaintext = bytes_of("same input");

    auto a = crypto.encrypt(plaintext);
    auto b = crypto.encrypt(plaintext);
    EXPECT_NE(a, b);
    EXPECT_NE(std::vector<uint8_t>(a.begin(), a.begin() + Crypto::kNonceSize),
              std::vector<uint8_t>(b.begin(), b.begin() + Crypto::kNonceSize));
}

TEST(CryptoTest, WrongKeyFailsAuthentication) {
    Crypto writer(Crypto::generate_key());
    Crypto reader(Crypto::generate_key());
    auto sealed = writer.encrypt(bytes_of("secret"));

    EXPECT_EQ(code_of([&] { reader.decrypt(sealed); }), ErrorCode::ENCRYPTION);
}

TEST(CryptoTest, AnyFlippedByteIsDetected) {
    Crypto crypto(Crypto::generate_key());
    auto sealed = crypto.encrypt(bytes_of("tamper with me"));

    for (size_t i = 0; i < sealed.size(); ++i) {
        auto tampered = sealed;
        tampered[i] ^= 0x01;
        EXPECT_EQ(code_of([&] { crypto.decrypt(tampered); }), ErrorCode::ENCRYPTION) << "byte " << i;
    }
}

TEST(CryptoTest, ShortBufferRejected) {
    Crypto crypto(Crypto::generate_key());
    std::vector<uint8_t> tiny(Crypto::kNonceSize + Crypto::kTagSize - 1, 0);
    EXPECT_EQ(code_of([&] { crypto.decrypt(tiny); }), ErrorCode::ENCRYPTION);
}

TEST(CryptoTest, KeyMustBe32Bytes) {
    EXPECT_EQ(code_of([] { Crypto c(std::vector<uint8_t>(16, 1)); }), ErrorCode::ENCRYPTION);
    EXPECT_EQ(code_of([] { Crypto c(std::vector<uint8_t>(33, 1)); }), ErrorCode::ENCRYPTION);
    EXPECT_NO_THROW(Crypto c(std::vector<uint8_t>(32, 1)));
}

TEST(CryptoTest, HexKeyRoundTrip) {
    auto key = Crypto::generate_key();
    ASSERT_EQ(key.size(), Crypto::kKeySize);

    std::string hex = Crypto::key_to_hex(key);
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(Crypto::key_from_hex(hex), key);
    EXPECT_EQ(Crypto::key_from_hex("00ff10AB"), (std::vector<uint8_t>{0x00, 0xff, 0x10, 0xab}));
}

TEST(CryptoTest, MalformedHexIsConfigError) {
    EXPECT_EQ(code_of([] { Crypto::key_from_hex("abc"); }), ErrorCode::CONFIG);
    EXPECT_EQ(code_of([] { Crypto::key_from_hex("zz"); }), ErrorCode::CONFIG);
}
