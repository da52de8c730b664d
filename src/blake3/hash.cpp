#include <blake3.h>
#include <estate/blake3/hash.hpp>
#include <iterator>
#include <memory>
#include <ranges>

namespace estate::blake3 {

estate::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  // BLAKE3_OUT_LEN
  auto output = estate::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

estate::schema::hash32_t hash(const estate::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  // BLAKE3_OUT_LEN
  auto output = estate::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

struct hasher::state final {
  blake3_hasher native{};
};

hasher::hasher() : state_{std::make_shared<state>()} {
  blake3_hasher_init(&state_->native);
}

hasher& hasher::update(const estate::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_->native, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_->native, str.data(), str.size());
  return *this;
}

estate::schema::hash32_t hasher::finalize() const {
  auto output = estate::schema::hash32_t{};
  blake3_hasher_finalize(&state_->native, output.data(), output.size());
  return output;
}

}  // namespace estate::blake3
