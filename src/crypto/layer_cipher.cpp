#include "cypherpunk/crypto/layer_cipher.hpp"
#include "cypherpunk/crypto/sodium_interop.hpp"
#include "cypherpunk/core/constants.hpp"
#include "cypherpunk/core/format.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace cypherpunk::remailer::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    using BytesResult = Result<std::vector<uint8_t>, RemailerFailure>;

    struct CipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

    struct KdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    void Wipe(std::vector<uint8_t>& buffer) {
        auto wipe = SodiumInterop::SecureWipe(buffer);
        (void)wipe;
    }

    BytesResult DeriveLayerKey(
        const std::span<const uint8_t> shared_secret,
        const std::span<const uint8_t> salt) {

        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_HKDF.data(), nullptr);
        if (!kdf) {
            return BytesResult::Err(RemailerFailure::Generic("Failed to fetch HKDF algorithm"));
        }
        KdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
        EVP_KDF_free(kdf);
        if (!kctx) {
            return BytesResult::Err(RemailerFailure::Generic("Failed to create HKDF context"));
        }

        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(
                "digest", const_cast<char*>(OpenSSL::ALGORITHM_SHA256.data()), 0),
            OSSL_PARAM_construct_octet_string(
                "key", const_cast<uint8_t*>(shared_secret.data()), shared_secret.size()),
            OSSL_PARAM_construct_octet_string(
                "salt", const_cast<uint8_t*>(salt.data()), salt.size()),
            OSSL_PARAM_construct_octet_string(
                "info",
                const_cast<char*>(Constants::LAYER_KDF_INFO.data()),
                Constants::LAYER_KDF_INFO.size()),
            OSSL_PARAM_construct_end()
        };

        std::vector<uint8_t> key(Constants::AES_KEY_SIZE);
        if (EVP_KDF_derive(kctx.get(), key.data(), key.size(), params) != OpenSSL::SUCCESS) {
            return BytesResult::Err(
                RemailerFailure::Generic(
                    compat::format("HKDF key derivation failed: {}", GetOpenSSLError())));
        }
        return BytesResult::Ok(std::move(key));
    }

    BytesResult AesGcmEncrypt(
        const std::span<const uint8_t> key,
        const std::span<const uint8_t> nonce,
        const std::span<const uint8_t> plaintext,
        const std::span<const uint8_t> associated_data) {

        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS
            || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                   static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS
            || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }

        std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
        int ciphertext_len = 0;
        if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
            Wipe(output);
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
        }
        int final_len = 0;
        if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
            Wipe(output);
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
        }
        ciphertext_len += final_len;
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                                output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
            Wipe(output);
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
        }
        output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
        return BytesResult::Ok(std::move(output));
    }

    BytesResult AesGcmDecrypt(
        const std::span<const uint8_t> key,
        const std::span<const uint8_t> nonce,
        const std::span<const uint8_t> ciphertext_with_tag,
        const std::span<const uint8_t> associated_data) {

        if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
            return BytesResult::Err(
                RemailerFailure::Decode(std::string(ErrorMessages::CIPHERTEXT_TOO_SMALL)));
        }
        const size_t ciphertext_size = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS
            || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                   static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS
            || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> plaintext(ciphertext_size);
        int plaintext_len = 0;
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &plaintext_len,
                              ciphertext_with_tag.data(),
                              static_cast<int>(ciphertext_size)) != OpenSSL::SUCCESS) {
            Wipe(plaintext);
            return BytesResult::Err(RemailerFailure::Decode(
                compat::format("Decryption failed: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_size),
                                 ciphertext_with_tag.end());
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                static_cast<int>(tag.size()), tag.data()) != OpenSSL::SUCCESS) {
            Wipe(plaintext);
            return BytesResult::Err(RemailerFailure::Generic(
                compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
        }
        int final_len = 0;
        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
            Wipe(plaintext);
            return BytesResult::Err(RemailerFailure::Decode(
                std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
        }
        plaintext.resize(static_cast<size_t>(plaintext_len + final_len));
        return BytesResult::Ok(std::move(plaintext));
    }

    std::vector<uint8_t> Concat(const std::span<const uint8_t> a, const std::span<const uint8_t> b) {
        std::vector<uint8_t> joined(a.begin(), a.end());
        joined.insert(joined.end(), b.begin(), b.end());
        return joined;
    }
}

Result<std::vector<uint8_t>, RemailerFailure> LayerCipher::Seal(
    const std::span<const uint8_t> plaintext,
    const std::span<const uint8_t> recipient_public_key) {

    if (recipient_public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return BytesResult::Err(RemailerFailure::InvalidInput(
            compat::format("Layer recipient key must be {} bytes, got {}",
                           Constants::X_25519_PUBLIC_KEY_SIZE, recipient_public_key.size())));
    }

    auto keypair_result = SodiumInterop::GenerateX25519KeyPair("ephemeral layer");
    if (keypair_result.IsErr()) {
        return BytesResult::Err(std::move(keypair_result).UnwrapErr());
    }
    auto [ephemeral_sk, ephemeral_pk] = std::move(keypair_result).Unwrap();

    auto shared_result = SodiumInterop::ComputeSharedSecret(ephemeral_sk, recipient_public_key);
    Wipe(ephemeral_sk);
    if (shared_result.IsErr()) {
        return BytesResult::Err(std::move(shared_result).UnwrapErr());
    }
    auto shared = std::move(shared_result).Unwrap();

    const auto salt = Concat(ephemeral_pk, recipient_public_key);
    auto key_result = DeriveLayerKey(shared, salt);
    Wipe(shared);
    if (key_result.IsErr()) {
        return key_result;
    }
    auto key = std::move(key_result).Unwrap();

    std::vector<uint8_t> sealed;
    sealed.reserve(HEADER_SIZE + plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    sealed.push_back(Constants::SEALED_LAYER_VERSION);
    sealed.insert(sealed.end(), ephemeral_pk.begin(), ephemeral_pk.end());
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    sealed.insert(sealed.end(), nonce.begin(), nonce.end());

    auto ciphertext_result = AesGcmEncrypt(key, nonce, plaintext, sealed);
    Wipe(key);
    if (ciphertext_result.IsErr()) {
        return ciphertext_result;
    }
    const auto& ciphertext = ciphertext_result.Unwrap();
    sealed.insert(sealed.end(), ciphertext.begin(), ciphertext.end());
    return BytesResult::Ok(std::move(sealed));
}

Result<std::vector<uint8_t>, RemailerFailure> LayerCipher::Open(
    const std::span<const uint8_t> sealed,
    const std::span<const uint8_t> recipient_secret_key) {

    if (sealed.size() < HEADER_SIZE + Constants::AES_GCM_TAG_SIZE) {
        return BytesResult::Err(
            RemailerFailure::Decode(std::string(ErrorMessages::CIPHERTEXT_TOO_SMALL)));
    }
    if (sealed[0] != Constants::SEALED_LAYER_VERSION) {
        return BytesResult::Err(RemailerFailure::Decode(
            compat::format("Unsupported sealed layer version {}", sealed[0])));
    }
    if (recipient_secret_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return BytesResult::Err(RemailerFailure::InvalidInput(
            compat::format("Layer secret key must be {} bytes, got {}",
                           Constants::X_25519_PRIVATE_KEY_SIZE, recipient_secret_key.size())));
    }

    const auto ephemeral_pk = sealed.subspan(1, Constants::X_25519_PUBLIC_KEY_SIZE);
    const auto nonce = sealed.subspan(1 + Constants::X_25519_PUBLIC_KEY_SIZE, Constants::AES_GCM_NONCE_SIZE);
    const auto header = sealed.first(HEADER_SIZE);
    const auto ciphertext = sealed.subspan(HEADER_SIZE);

    std::vector<uint8_t> recipient_pk(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_scalarmult_base(recipient_pk.data(), recipient_secret_key.data()) != SodiumConstants::SUCCESS) {
        return BytesResult::Err(RemailerFailure::Generic("Failed to derive layer public key"));
    }

    auto shared_result = SodiumInterop::ComputeSharedSecret(recipient_secret_key, ephemeral_pk);
    if (shared_result.IsErr()) {
        return BytesResult::Err(std::move(shared_result).UnwrapErr());
    }
    auto shared = std::move(shared_result).Unwrap();
    const auto salt = Concat(ephemeral_pk, recipient_pk);
    auto key_result = DeriveLayerKey(shared, salt);
    Wipe(shared);
    if (key_result.IsErr()) {
        return key_result;
    }
    auto key = std::move(key_result).Unwrap();
    auto plaintext = AesGcmDecrypt(key, nonce, ciphertext, header);
    Wipe(key);
    return plaintext;
}

}
