#include "cypherpunk/crypto/sealed_layer_backend.hpp"
#include "cypherpunk/crypto/layer_cipher.hpp"
#include "cypherpunk/crypto/armor.hpp"
#include "cypherpunk/crypto/sodium_interop.hpp"

#include <string>

namespace cypherpunk::remailer::crypto {

Result<std::unique_ptr<SealedLayerBackend>, RemailerFailure> SealedLayerBackend::Create() {
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<std::unique_ptr<SealedLayerBackend>, RemailerFailure>::Err(
            RemailerFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    return Result<std::unique_ptr<SealedLayerBackend>, RemailerFailure>::Ok(
        std::unique_ptr<SealedLayerBackend>(new SealedLayerBackend()));
}

Result<std::vector<uint8_t>, RemailerFailure> SealedLayerBackend::Encrypt(
    const std::span<const uint8_t> plaintext,
    const directory::KeyHandle& recipient) {

    auto sealed = LayerCipher::Seal(plaintext, recipient.material);
    if (sealed.IsErr()) {
        return sealed;
    }
    const std::string armored = Armor::Encode(sealed.Unwrap(), ARMOR_LABEL);
    return Result<std::vector<uint8_t>, RemailerFailure>::Ok(
        std::vector<uint8_t>(armored.begin(), armored.end()));
}

Result<std::vector<uint8_t>, RemailerFailure> SealedLayerBackend::Open(
    const std::span<const uint8_t> armored,
    const std::span<const uint8_t> recipient_secret_key) {

    const std::string_view text(reinterpret_cast<const char*>(armored.data()), armored.size());
    auto sealed = Armor::Decode(text, ARMOR_LABEL);
    if (sealed.IsErr()) {
        return sealed;
    }
    return LayerCipher::Open(sealed.Unwrap(), recipient_secret_key);
}

}
