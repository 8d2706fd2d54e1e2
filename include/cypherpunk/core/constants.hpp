#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace cypherpunk::remailer {
struct Constants {
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
    static constexpr std::string_view LAYER_KDF_INFO = "Cypherpunk-Layer-v1";
    static constexpr uint8_t SEALED_LAYER_VERSION = 1;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct WireFormat {
    static constexpr std::string_view NEWLINE = "\n";
    static constexpr std::string_view CRLF = "\r\n";
    static constexpr std::string_view REMAILER_MARKER = "::";
    static constexpr std::string_view PASTED_MARKER = "##";
    static constexpr std::string_view ANON_TO = "Anon-To";
    static constexpr std::string_view ENCRYPTED = "Encrypted";
    static constexpr std::string_view LATENT_TIME = "Latent-Time";
    static constexpr std::string_view SUBJECT = "Subject";
    static constexpr std::string_view PGP_SCHEME = "PGP";
    static constexpr std::string_view HEADER_SEPARATOR = ": ";
    static constexpr std::string_view WILDCARD_TOKEN = "*";
    static constexpr std::string_view ARMOR_LABEL = "PGP MESSAGE";
    static constexpr size_t ARMOR_LINE_LENGTH = 64;
};
struct KeyFiles {
    static constexpr std::string_view GPG_EXTENSION = ".asc";
    static constexpr std::string_view SEALED_EXTENSION = ".pub";
};
struct ChainLimits {
    static constexpr size_t DEFAULT_MAX_CHAIN_LENGTH = 8;
    static constexpr size_t DEFAULT_MAX_REDUNDANCY = 16;
    static constexpr double RELIABLE_MIN_UPTIME = 95.0;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view EMPTY_CHAIN = "Remailer chain is empty";
    static constexpr std::string_view CIPHERTEXT_TOO_SMALL = "Ciphertext too small";
    static constexpr std::string_view MISSING_REMAILER_MARKER = "Missing '::' remailer header marker";
    static constexpr std::string_view MISSING_ANON_TO = "Envelope has no Anon-To directive";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "AES-GCM decryption failed (authentication tag mismatch)";
};
}
