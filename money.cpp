#include "money.hpp"

#include <cctype>

namespace wallet {

std::optional<Amount> parseAmount(const std::string& text) {
  std::size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  std::size_t end = text.size();
  while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

  if (pos == end) return std::nullopt;

  bool negative = false;
  if (text[pos] == '-' || text[pos] == '+') {
    negative = text[pos] == '-';
    ++pos;
  }

  Amount whole = 0;
  Amount fraction = 0;
  int fraction_digits = 0;
  int whole_digits = 0;
  bool seen_separator = false;

  for (; pos < end; ++pos) {
    const char c = text[pos];
    if (c == '.' || c == ',') {
      if (seen_separator) return std::nullopt;
      seen_separator = true;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;

    const int digit = c - '0';
    if (seen_separator) {
      if (++fraction_digits > 2) return std::nullopt;
      fraction = fraction * 10 + digit;
    } else {
      ++whole_digits;
      if (whole > kMaxAmount / kMinorUnitsPerMajor) return std::nullopt;
      whole = whole * 10 + digit;
    }
  }

  if (whole_digits == 0 && fraction_digits == 0) return std::nullopt;
  if (fraction_digits == 1) fraction *= 10;

  if (whole > kMaxAmount / kMinorUnitsPerMajor) return std::nullopt;
  const Amount cents = whole * kMinorUnitsPerMajor + fraction;
  if (cents > kMaxAmount) return std::nullopt;

  return negative ? -cents : cents;
}

std::string formatAmount(Amount amount) {
  const bool negative = amount < 0;
  const Amount magnitude = negative ? -amount : amount;
  const Amount cents = magnitude % kMinorUnitsPerMajor;

  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / kMinorUnitsPerMajor);
  out += '.';
  if (cents < 10) out += '0';
  out += std::to_string(cents);
  return out;
}

}  // namespace wallet
