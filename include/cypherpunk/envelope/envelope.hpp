#pragma once
#include "cypherpunk/directory/remailer_directory.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
namespace cypherpunk::remailer::envelope {
using Header = std::pair<std::string, std::string>;
using HeaderList = std::vector<Header>;

/// Plaintext block one hop decrypts: "::" directives, optional "##" headers, body.
struct Envelope {
    HeaderList visible_headers;
    std::string recipient_directive;
    HeaderList pasted_headers;
    std::vector<uint8_t> body;
};

struct EncryptedLayer {
    std::vector<uint8_t> ciphertext;
    directory::RecordPtr target;
};

/// What the end recipient should receive; recipient is an opaque address.
struct OutgoingMessage {
    std::string recipient;
    std::string subject;
    HeaderList recipient_headers;
    HeaderList final_directives;
    std::vector<uint8_t> body;
};

/**
 * Routing requirement handed to the builder for one hop.
 *
 * For the exit hop, address is the end recipient and directives are the
 * caller's final-hop directives. For a forwarding hop, address is the next
 * hop's remailer address and directives are whatever that single hop should
 * see (a Latent-Time, for example), never headers meant for other hops.
 */
struct HopRequirement {
    std::string address;
    HeaderList directives;
    HeaderList pasted_headers;
    std::string scheme;
};
}
