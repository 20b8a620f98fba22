#include "lfs/crypto/cipher_provider.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <climits>
#include <memory>

namespace lfs::crypto {
namespace {

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherContext new_context() {
    return CipherContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

template<typename T>
Result<T> cipher_error(ErrorKind kind, const std::string& step) {
    return Err<T>(kind, "AES-GCM " + step + " failed");
}

} // namespace

Result<CipherResult> AesGcmCipher::encrypt(const Bytes& plaintext, const Bytes& key) {
    if (key.size() != kKeyByteSize) {
        return Err<CipherResult>(ErrorKind::InvalidArgument,
                                 "Expected a " + std::to_string(kKeyByteSize) + " byte key, got " +
                                     std::to_string(key.size()));
    }
    if (plaintext.size() > static_cast<std::size_t>(INT_MAX - kAuthTagByteSize)) {
        return Err<CipherResult>(ErrorKind::InvalidArgument, "Plaintext too large for a single message");
    }

    CipherResult result;
    result.iv.resize(kIvByteSize);
    if (RAND_bytes(result.iv.data(), static_cast<int>(result.iv.size())) != 1) {
        return cipher_error<CipherResult>(ErrorKind::InvalidState, "IV generation");
    }

    auto ctx = new_context();
    if (!ctx) {
        return cipher_error<CipherResult>(ErrorKind::InvalidState, "context allocation");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvByteSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), result.iv.data()) != 1) {
        return cipher_error<CipherResult>(ErrorKind::InvalidState, "encryption setup");
    }

    result.ciphertext.resize(plaintext.size() + kAuthTagByteSize);
    int length = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &length,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return cipher_error<CipherResult>(ErrorKind::InvalidState, "encryption");
        }
        total = length;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), result.ciphertext.data() + total, &length) != 1) {
        return cipher_error<CipherResult>(ErrorKind::InvalidState, "encryption");
    }
    total += length;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAuthTagByteSize),
                            result.ciphertext.data() + total) != 1) {
        return cipher_error<CipherResult>(ErrorKind::InvalidState, "tag extraction");
    }
    result.ciphertext.resize(static_cast<std::size_t>(total) + kAuthTagByteSize);
    return Ok(std::move(result));
}

Result<Bytes> AesGcmCipher::decrypt(const Bytes& iv, const Bytes& key, const Bytes& ciphertext) {
    if (key.size() != kKeyByteSize || iv.size() != kIvByteSize) {
        return Err<Bytes>(ErrorKind::InvalidArgument, "AES-GCM expects a 32 byte key and a 12 byte IV");
    }
    if (ciphertext.size() < kAuthTagByteSize ||
        ciphertext.size() > static_cast<std::size_t>(INT_MAX)) {
        return cipher_error<Bytes>(ErrorKind::DecryptionFailed, "ciphertext length check");
    }

    auto ctx = new_context();
    if (!ctx) {
        return cipher_error<Bytes>(ErrorKind::InvalidState, "context allocation");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvByteSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
        return cipher_error<Bytes>(ErrorKind::InvalidState, "decryption setup");
    }

    const std::size_t data_length = ciphertext.size() - kAuthTagByteSize;
    Bytes plaintext(data_length + kAuthTagByteSize);
    int length = 0;
    int total = 0;
    if (data_length > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &length,
                              ciphertext.data(), static_cast<int>(data_length)) != 1) {
            return cipher_error<Bytes>(ErrorKind::DecryptionFailed, "decryption");
        }
        total = length;
    }

    Bytes tag(ciphertext.end() - static_cast<std::ptrdiff_t>(kAuthTagByteSize), ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAuthTagByteSize), tag.data()) != 1) {
        return cipher_error<Bytes>(ErrorKind::InvalidState, "tag setup");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &length) != 1) {
        return cipher_error<Bytes>(ErrorKind::DecryptionFailed, "authentication");
    }
    total += length;

    plaintext.resize(static_cast<std::size_t>(total));
    return Ok(std::move(plaintext));
}

Result<ByteCount> encrypted_data_size(ByteCount plaintext) {
    const auto size = plaintext.checked_plus(ByteCount(kAuthTagByteSize));
    if (!size) {
        return Err<ByteCount>(ErrorKind::InvalidArgument, "Encrypted size of " + std::to_string(plaintext.value()) +
                                                              " bytes exceeds 64 bits");
    }
    return Ok(*size);
}

Result<std::string> decrypt_entity_name(CipherProvider& cipher,
                                        const Bytes& iv,
                                        const Bytes& key,
                                        const Bytes& ciphertext) {
    const auto failed = []() {
        return Err<std::string>(ErrorKind::DecryptionFailed, "Entity metadata could not be decrypted");
    };

    auto plaintext = cipher.decrypt(iv, key, ciphertext);
    if (plaintext.is_error()) {
        spdlog::debug("Entity metadata decryption failed: {}", plaintext.error().describe());
        return failed();
    }

    const auto metadata = nlohmann::json::parse(plaintext.value().begin(), plaintext.value().end(), nullptr, false);
    if (metadata.is_discarded() || !metadata.is_object()) {
        return failed();
    }
    const auto name = metadata.find("name");
    if (name == metadata.end() || !name->is_string()) {
        return failed();
    }
    return Ok(name->get<std::string>());
}

} // namespace lfs::crypto
