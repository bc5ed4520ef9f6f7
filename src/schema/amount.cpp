#include <boost/multiprecision/cpp_int.hpp>
#include <coffer/schema/amount.hpp>

#include <limits>

namespace coffer::schema {

namespace {

using wide_t = boost::multiprecision::int128_t;

const auto kMinMinor = wide_t{std::numeric_limits<int64_t>::min()};
const auto kMaxMinor = wide_t{std::numeric_limits<int64_t>::max()};

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

std::optional<amount_t> narrow(const wide_t& value) {
  if (value < kMinMinor || value > kMaxMinor) {
    return std::nullopt;
  }
  return amount_t{.minor_units = value.convert_to<int64_t>()};
}

}  // namespace

std::optional<amount_t> try_parse_amount(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  auto negative = false;
  if (text.front() == '+' || text.front() == '-') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  auto whole = text;
  auto fraction = std::string_view{};
  if (auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
    if (fraction.empty()) {
      return std::nullopt;
    }
  }
  if (whole.empty() || fraction.size() > kAmountFractionDigits) {
    return std::nullopt;
  }

  // Keeps the accumulator far inside 128 bits; narrow() does the real check.
  if (whole.size() > 19) {
    return std::nullopt;
  }

  auto value = wide_t{0};
  for (const auto c : whole) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    value = (value * 10) + (c - '0');
  }
  for (auto i = 0u; i < kAmountFractionDigits; ++i) {
    value *= 10;
    if (i < fraction.size()) {
      if (!is_digit(fraction[i])) {
        return std::nullopt;
      }
      value += fraction[i] - '0';
    }
  }
  if (negative) {
    value = -value;
  }
  return narrow(value);
}

std::string to_string(const amount_t& value) {
  auto magnitude = wide_t{value.minor_units};
  auto negative = magnitude < 0;
  if (negative) {
    magnitude = -magnitude;
  }
  auto whole = wide_t{magnitude / kAmountMinorPerUnit};
  auto fraction =
      wide_t{magnitude % kAmountMinorPerUnit}.convert_to<int>();

  auto out = std::string{};
  if (negative) {
    out.push_back('-');
  }
  out += whole.str();
  out.push_back('.');
  out.push_back(static_cast<char>('0' + (fraction / 10)));
  out.push_back(static_cast<char>('0' + (fraction % 10)));
  return out;
}

std::optional<amount_t> checked_add(const amount_t& lhs, const amount_t& rhs) {
  return narrow(wide_t{lhs.minor_units} + wide_t{rhs.minor_units});
}

}  // namespace coffer::schema
