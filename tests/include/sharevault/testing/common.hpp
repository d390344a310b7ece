#pragma once

#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace sharevault::testing {

using scale_encoder_t = sharevault::schema::encoding::encoder<
    sharevault::schema::encoding::scale_encoder_tag>;

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

template <typename T>
T decode_as(const sharevault::schema::bytes_t& bytes) {
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(
      sharevault::schema::bytes_view_t{bytes.data(), bytes.size()});
}

inline sharevault::schema::amount_t whole_units(const uint64_t count) {
  return sharevault::schema::amount_t{count} * sharevault::schema::kWholeUnit;
}

}  // namespace sharevault::testing
