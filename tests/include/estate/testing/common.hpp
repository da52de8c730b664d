#pragma once

#include <estate/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace estate::testing {

inline constexpr auto kOwner = std::string_view{"owner.near"};
inline constexpr auto kAdmin = std::string_view{"admin.near"};
inline constexpr auto kSecondAdmin = std::string_view{"admin2.near"};
inline constexpr auto kOracle = std::string_view{"oracle.near"};
inline constexpr auto kSeller = std::string_view{"seller.near"};
inline constexpr auto kAlice = std::string_view{"alice.near"};
inline constexpr auto kBob = std::string_view{"bob.near"};
inline constexpr auto kCarol = std::string_view{"carol.near"};
inline constexpr auto kToken = std::string_view{"usdc.token"};
inline constexpr auto kOtherToken = std::string_view{"dai.token"};

inline estate::schema::timestamp_nanoseconds_t days(const uint64_t count) {
  return count * estate::schema::kNanosecondsPerDay;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace estate::testing
