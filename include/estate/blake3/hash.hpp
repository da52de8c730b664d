#pragma once
#include <estate/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace estate::blake3 {

estate::schema::hash32_t hash(const std::string_view& str);
estate::schema::hash32_t hash(const estate::schema::bytes_view_t& bytes);

/// Incremental hasher for digests over many rows.
class hasher final {
 public:
  hasher();

  hasher& update(const estate::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);
  estate::schema::hash32_t finalize() const;

 private:
  struct state;
  std::shared_ptr<state> state_;
};

}  // namespace estate::blake3
