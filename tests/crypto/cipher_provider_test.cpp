#include "lfs/crypto/cipher_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

using lfs::ByteCount;
using lfs::ErrorKind;
using lfs::Result;
using lfs::crypto::AesGcmCipher;
using lfs::crypto::Bytes;
using lfs::crypto::CipherProvider;
using lfs::crypto::CipherResult;

namespace {

Bytes key_of(std::uint8_t fill) {
    return Bytes(lfs::crypto::kKeyByteSize, fill);
}

Bytes bytes_of(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

// Returns a fixed plaintext regardless of input
class FixedCipher : public CipherProvider {
public:
    explicit FixedCipher(Result<Bytes> plaintext) : plaintext_(std::move(plaintext)) {}

    Result<CipherResult> encrypt(const Bytes&, const Bytes&) override {
        return lfs::Err<CipherResult>(ErrorKind::InvalidState, "not used");
    }

    Result<Bytes> decrypt(const Bytes&, const Bytes&, const Bytes&) override {
        return plaintext_;
    }

private:
    Result<Bytes> plaintext_;
};

} // namespace

TEST(AesGcmCipherTest, RoundTripAppendsTag) {
    AesGcmCipher cipher;
    const auto plaintext = bytes_of("private drive payload");

    auto encrypted = cipher.encrypt(plaintext, key_of(7));
    ASSERT_TRUE(encrypted.is_ok());
    EXPECT_EQ(encrypted.value().iv.size(), lfs::crypto::kIvByteSize);
    EXPECT_EQ(encrypted.value().ciphertext.size(), plaintext.size() + lfs::crypto::kAuthTagByteSize);

    auto decrypted = cipher.decrypt(encrypted.value().iv, key_of(7), encrypted.value().ciphertext);
    ASSERT_TRUE(decrypted.is_ok());
    EXPECT_EQ(decrypted.value(), plaintext);
}

TEST(AesGcmCipherTest, EmptyPlaintextIsJustTheTag) {
    AesGcmCipher cipher;

    auto encrypted = cipher.encrypt({}, key_of(1));
    ASSERT_TRUE(encrypted.is_ok());
    EXPECT_EQ(encrypted.value().ciphertext.size(), lfs::crypto::kAuthTagByteSize);

    auto decrypted = cipher.decrypt(encrypted.value().iv, key_of(1), encrypted.value().ciphertext);
    ASSERT_TRUE(decrypted.is_ok());
    EXPECT_TRUE(decrypted.value().empty());
}

TEST(AesGcmCipherTest, TamperedOrWrongKeyFailsAuthentication) {
    AesGcmCipher cipher;
    auto encrypted = cipher.encrypt(bytes_of("secret"), key_of(3));
    ASSERT_TRUE(encrypted.is_ok());

    auto tampered = encrypted.value().ciphertext;
    tampered[0] ^= 0x01;
    auto bad_data = cipher.decrypt(encrypted.value().iv, key_of(3), tampered);
    ASSERT_TRUE(bad_data.is_error());
    EXPECT_EQ(bad_data.error().kind, ErrorKind::DecryptionFailed);

    auto bad_key = cipher.decrypt(encrypted.value().iv, key_of(4), encrypted.value().ciphertext);
    ASSERT_TRUE(bad_key.is_error());
    EXPECT_EQ(bad_key.error().kind, ErrorKind::DecryptionFailed);

    auto truncated = cipher.decrypt(encrypted.value().iv, key_of(3), Bytes(4, 0));
    ASSERT_TRUE(truncated.is_error());
    EXPECT_EQ(truncated.error().kind, ErrorKind::DecryptionFailed);
}

TEST(AesGcmCipherTest, RejectsBadKeyOrIvSize) {
    AesGcmCipher cipher;

    auto short_key = cipher.encrypt(bytes_of("x"), Bytes(16, 0));
    ASSERT_TRUE(short_key.is_error());
    EXPECT_EQ(short_key.error().kind, ErrorKind::InvalidArgument);

    auto short_iv = cipher.decrypt(Bytes(8, 0), key_of(0), Bytes(32, 0));
    ASSERT_TRUE(short_iv.is_error());
    EXPECT_EQ(short_iv.error().kind, ErrorKind::InvalidArgument);
}

TEST(EncryptedDataSizeTest, AddsTagOverhead) {
    EXPECT_EQ(lfs::crypto::encrypted_data_size(ByteCount(0)).value(), ByteCount(16));
    EXPECT_EQ(lfs::crypto::encrypted_data_size(ByteCount(262144)).value(), ByteCount(262160));

    auto overflow = lfs::crypto::encrypted_data_size(ByteCount(std::numeric_limits<std::uint64_t>::max() - 8));
    ASSERT_TRUE(overflow.is_error());
    EXPECT_EQ(overflow.error().kind, ErrorKind::InvalidArgument);
}

TEST(DecryptEntityNameTest, ReadsNameFromMetadata) {
    FixedCipher cipher(lfs::Ok(bytes_of(R"({"name":"report.pdf","dataContentType":"application/pdf"})")));

    auto name = lfs::crypto::decrypt_entity_name(cipher, {}, {}, {});
    ASSERT_TRUE(name.is_ok());
    EXPECT_EQ(name.value(), "report.pdf");
}

TEST(DecryptEntityNameTest, EveryFailureLooksTheSame) {
    FixedCipher wrong_key(lfs::Err<Bytes>(ErrorKind::DecryptionFailed, "AES-GCM authentication failed"));
    FixedCipher not_json(lfs::Ok(bytes_of("\x01\x02garbage")));
    FixedCipher no_name(lfs::Ok(bytes_of(R"({"size":12})")));

    for (CipherProvider* cipher : {static_cast<CipherProvider*>(&wrong_key),
                                   static_cast<CipherProvider*>(&not_json),
                                   static_cast<CipherProvider*>(&no_name)}) {
        auto name = lfs::crypto::decrypt_entity_name(*cipher, {}, {}, {});
        ASSERT_TRUE(name.is_error());
        EXPECT_EQ(name.error().kind, ErrorKind::DecryptionFailed);
        EXPECT_EQ(name.error().message, "Entity metadata could not be decrypted");
    }
}

TEST(DecryptEntityNameTest, WorksWithRealCipher) {
    AesGcmCipher cipher;
    auto encrypted = cipher.encrypt(bytes_of(R"({"name":"notes.md"})"), key_of(9));
    ASSERT_TRUE(encrypted.is_ok());

    auto name = lfs::crypto::decrypt_entity_name(cipher, encrypted.value().iv, key_of(9),
                                                 encrypted.value().ciphertext);
    ASSERT_TRUE(name.is_ok());
    EXPECT_EQ(name.value(), "notes.md");

    auto wrong = lfs::crypto::decrypt_entity_name(cipher, encrypted.value().iv, key_of(8),
                                                  encrypted.value().ciphertext);
    ASSERT_TRUE(wrong.is_error());
    EXPECT_EQ(wrong.error().kind, ErrorKind::DecryptionFailed);
}
