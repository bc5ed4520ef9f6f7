#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace coffer::schema {

/// Bidirectional name table for a scoped enum. Names are the stable strings
/// used on the command line and in logs.
template <typename Enum, std::size_t N>
struct enum_names final {
  std::array<std::pair<std::string_view, Enum>, N> entries;

  constexpr std::optional<Enum> parse(const std::string_view value) const {
    for (const auto& [text, enum_value] : entries) {
      if (text == value) {
        return enum_value;
      }
    }
    return std::nullopt;
  }

  constexpr std::optional<std::string_view> name(const Enum value) const {
    for (const auto& [text, enum_value] : entries) {
      if (enum_value == value) {
        return text;
      }
    }
    return std::nullopt;
  }
};

template <typename Enum, std::size_t N>
enum_names(std::array<std::pair<std::string_view, Enum>, N>)
    -> enum_names<Enum, N>;

/// Specialized beside each named enum.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace coffer::schema
