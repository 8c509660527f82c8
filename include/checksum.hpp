#pragma once
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include "protocol.hpp"

namespace ferry {

// Incremental 128-bit BLAKE2b over one chunk payload.
class ChunkHasher {
public:
    ChunkHasher();
    void update(const uint8_t* data, size_t len);
    Digest finish();
private:
    crypto_generichash_state state_;
};

Digest chunk_digest(const uint8_t* data, size_t len);

} // namespace ferry
