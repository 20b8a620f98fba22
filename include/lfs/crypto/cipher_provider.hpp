#pragma once

#include "lfs/core/result.hpp"
#include "lfs/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lfs::crypto {

using Bytes = std::vector<std::uint8_t>;

/// AES-256-GCM as used for private drive data
inline constexpr std::size_t kKeyByteSize = 32;
inline constexpr std::size_t kIvByteSize = 12;
inline constexpr std::size_t kAuthTagByteSize = 16;

struct CipherResult {
    Bytes ciphertext;  ///< Encrypted data followed by the authentication tag
    Bytes iv;
};

/**
 * @brief Encrypts and decrypts private drive payloads
 *
 * The engine treats the cipher as opaque: it only needs the size overhead
 * (encrypted_data_size) and a decrypt that reports failure instead of
 * returning garbage.
 */
class CipherProvider {
public:
    virtual ~CipherProvider() = default;

    virtual Result<CipherResult> encrypt(const Bytes& plaintext, const Bytes& key) = 0;
    virtual Result<Bytes> decrypt(const Bytes& iv, const Bytes& key, const Bytes& ciphertext) = 0;
};

/**
 * @brief OpenSSL AES-256-GCM with a random 96-bit IV per message
 */
class AesGcmCipher : public CipherProvider {
public:
    Result<CipherResult> encrypt(const Bytes& plaintext, const Bytes& key) override;
    Result<Bytes> decrypt(const Bytes& iv, const Bytes& key, const Bytes& ciphertext) override;
};

/// Size of `plaintext` once encrypted: the GCM tag travels with the data
Result<ByteCount> encrypted_data_size(ByteCount plaintext);

/**
 * @brief Decrypt entity metadata ({"name": ...}) and return the name
 *
 * Every failure, whether a wrong key, a tampered payload or metadata that
 * is not the expected JSON, is reported as the same
 * ErrorKind::DecryptionFailed so that callers cannot tell them apart.
 */
Result<std::string> decrypt_entity_name(CipherProvider& cipher,
                                        const Bytes& iv,
                                        const Bytes& key,
                                        const Bytes& ciphertext);

} // namespace lfs::crypto
