#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief Encrypts configuration secrets such as community strings.
 *
 * Uses libsodium's XChaCha20-Poly1305 AEAD. The entry name is bound as
 * associated data, so a sealed value only opens under the name it was
 * sealed for. The key lives in a file next to the configuration and is
 * created with owner-only permissions on first use.
 *
 * @note This class is non-copyable.
 */
class SecureStorage {
public:
    /**
     * @param keyPath Path to the key file; created when missing.
     * @throws std::runtime_error if libsodium cannot be initialized or the key cannot be stored.
     */
    explicit SecureStorage(std::filesystem::path keyPath);

    /**
     * @brief Zeroes key material.
     */
    ~SecureStorage();

    SecureStorage(const SecureStorage&) = delete;
    SecureStorage& operator=(const SecureStorage&) = delete;

    /**
     * @brief Encrypts a secret for one entry name.
     * @param name Entry name, bound as associated data.
     * @param plaintext Secret value.
     * @return Base64 text of nonce followed by ciphertext and tag.
     */
    [[nodiscard]] std::string seal(const std::string& name, const std::string& plaintext) const;

    /**
     * @brief Decrypts a value produced by seal() for the same name.
     * @return The secret, or std::nullopt if the value was tampered with,
     *         sealed under another name or key, or is not valid base64.
     */
    [[nodiscard]] std::optional<std::string> open(const std::string& name, const std::string& sealed) const;

    [[nodiscard]] const std::filesystem::path& keyPath() const { return keyPath_; }

private:
    void loadOrGenerateKey();

    std::filesystem::path keyPath_;
    std::vector<unsigned char> key_;
};

std::string base64Encode(const std::vector<unsigned char>& data);

/**
 * @return Decoded bytes, or std::nullopt for malformed input.
 */
std::optional<std::vector<unsigned char>> base64Decode(const std::string& encoded);

} // namespace netsweep::infra
