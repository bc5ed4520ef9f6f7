#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace coffer::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using uuid_bytes_t = std::array<uint8_t, 16>;
using wallet_id_t = uuid_bytes_t;
using transaction_id_t = uuid_bytes_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

/// Fresh random (version 4) identifier for wallets and transactions.
uuid_bytes_t make_uuid();
/// Canonical 36 character form, e.g. `0e5b...-....`.
std::string to_string(const uuid_bytes_t& id);
std::optional<uuid_bytes_t> try_make_uuid(const std::string_view& text);
uuid_bytes_t make_uuid(const std::string_view& text);
uuid_bytes_t make_uuid(const bytes_view_t& bytes);

/// Wall clock in milliseconds since the unix epoch.
timestamp_milliseconds_t now_milliseconds();

}  // namespace coffer::schema

