#include "infrastructure/crypto/SecureStorage.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace netsweep::infra {

namespace {

constexpr size_t KEY_SIZE = crypto_aead_xchacha20poly1305_ietf_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
constexpr size_t TAG_SIZE = crypto_aead_xchacha20poly1305_ietf_ABYTES;
constexpr int BASE64_VARIANT = sodium_base64_VARIANT_ORIGINAL;

const unsigned char* bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

SecureStorage::SecureStorage(std::filesystem::path keyPath) : keyPath_(std::move(keyPath)) {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    key_.resize(KEY_SIZE);
    loadOrGenerateKey();
}

SecureStorage::~SecureStorage() {
    if (!key_.empty()) {
        sodium_memzero(key_.data(), key_.size());
    }
}

void SecureStorage::loadOrGenerateKey() {
    if (std::filesystem::exists(keyPath_)) {
        std::ifstream file(keyPath_, std::ios::binary);
        file.read(reinterpret_cast<char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
        if (file.gcount() == static_cast<std::streamsize>(KEY_SIZE)) {
            spdlog::debug("[Secure] Loaded key from {}", keyPath_.string());
            return;
        }
        // Secrets sealed under the old key can no longer be opened.
        spdlog::warn("[Secure] Key file {} is truncated, generating a new key", keyPath_.string());
    }

    crypto_aead_xchacha20poly1305_ietf_keygen(key_.data());

    auto parent = keyPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream file(keyPath_, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to create key file: " + keyPath_.string());
    }
    file.write(reinterpret_cast<const char*>(key_.data()), static_cast<std::streamsize>(KEY_SIZE));
    file.close();

#ifndef _WIN32
    std::filesystem::permissions(keyPath_, std::filesystem::perms::owner_read |
                                               std::filesystem::perms::owner_write);
#endif

    spdlog::info("[Secure] Generated new key at {}", keyPath_.string());
}

std::string SecureStorage::seal(const std::string& name, const std::string& plaintext) const {
    std::vector<unsigned char> out(NONCE_SIZE + plaintext.size() + TAG_SIZE);
    unsigned char* nonce = out.data();
    randombytes_buf(nonce, NONCE_SIZE);

    unsigned long long cipherLen = 0;
    crypto_aead_xchacha20poly1305_ietf_encrypt(out.data() + NONCE_SIZE, &cipherLen, bytes(plaintext),
                                               plaintext.size(), bytes(name), name.size(), nullptr,
                                               nonce, key_.data());
    out.resize(NONCE_SIZE + static_cast<size_t>(cipherLen));
    return base64Encode(out);
}

std::optional<std::string> SecureStorage::open(const std::string& name, const std::string& sealed) const {
    auto combined = base64Decode(sealed);
    if (!combined || combined->size() < NONCE_SIZE + TAG_SIZE) {
        spdlog::warn("[Secure] Sealed value for '{}' is malformed", name);
        return std::nullopt;
    }

    const unsigned char* nonce = combined->data();
    const unsigned char* cipher = combined->data() + NONCE_SIZE;
    size_t cipherLen = combined->size() - NONCE_SIZE;

    std::string plaintext(cipherLen - TAG_SIZE, '\0');
    unsigned long long plainLen = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(reinterpret_cast<unsigned char*>(plaintext.data()),
                                                   &plainLen, nullptr, cipher, cipherLen, bytes(name),
                                                   name.size(), nonce, key_.data()) != 0) {
        spdlog::warn("[Secure] Failed to open sealed value for '{}'", name);
        return std::nullopt;
    }
    plaintext.resize(static_cast<size_t>(plainLen));
    return plaintext;
}

std::string base64Encode(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return {};
    }

    size_t encodedLen = sodium_base64_encoded_len(data.size(), BASE64_VARIANT);
    std::string encoded(encodedLen, '\0');
    sodium_bin2base64(encoded.data(), encodedLen, data.data(), data.size(), BASE64_VARIANT);

    // encodedLen counts the terminating NUL
    encoded.resize(encodedLen - 1);
    return encoded;
}

std::optional<std::vector<unsigned char>> base64Decode(const std::string& encoded) {
    std::vector<unsigned char> decoded(encoded.size());
    size_t decodedLen = 0;
    const char* end = nullptr;

    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.c_str(), encoded.size(), nullptr,
                          &decodedLen, &end, BASE64_VARIANT) != 0 ||
        end != encoded.c_str() + encoded.size()) {
        return std::nullopt;
    }

    decoded.resize(decodedLen);
    return decoded;
}

} // namespace netsweep::infra
