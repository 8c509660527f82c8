#include "checksum.hpp"
#include <stdexcept>

namespace ferry {

static_assert(kDigestSize >= crypto_generichash_BYTES_MIN &&
                  kDigestSize <= crypto_generichash_BYTES_MAX,
              "digest size unsupported by crypto_generichash");

static void ensure_sodium() {
  static const int rc = sodium_init();
  if (rc < 0)
    throw std::runtime_error("sodium_init failed");
}

ChunkHasher::ChunkHasher() {
  ensure_sodium();
  crypto_generichash_init(&state_, nullptr, 0, kDigestSize);
}

void ChunkHasher::update(const uint8_t *data, size_t len) {
  crypto_generichash_update(&state_, data, len);
}

Digest ChunkHasher::finish() {
  Digest out{};
  crypto_generichash_final(&state_, out.data(), out.size());
  return out;
}

Digest chunk_digest(const uint8_t *data, size_t len) {
  ChunkHasher h;
  h.update(data, len);
  return h.finish();
}

} // namespace ferry
