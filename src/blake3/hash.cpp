#include <blake3.h>
#include <remit/blake3/hash.hpp>

namespace remit::blake3 {

remit::schema::hash32_t hash(const remit::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  // BLAKE3_OUT_LEN
  auto output = remit::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace remit::blake3
