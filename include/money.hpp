#ifndef WALLET_MONEY_HPP_
#define WALLET_MONEY_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace wallet {

// Amounts are kept in the smallest currency unit (cents).
using Amount = std::int64_t;

constexpr Amount kMinorUnitsPerMajor = 100;

// Upper bound accepted from text input; keeps sums far from int64 overflow.
constexpr Amount kMaxAmount = 1'000'000'000'000'000;

/**
 * Parses decimal text such as "100", "12.5", "12,50" or "-3.10" into cents.
 * Returns nullopt for empty or non-numeric text, more than two fraction digits,
 * or values beyond kMaxAmount.
 */
std::optional<Amount> parseAmount(const std::string& text);

/**
 * Renders cents as plain decimal text, e.g. 1234 -> "12.34".
 */
std::string formatAmount(Amount amount);

}  // namespace wallet

#endif  // WALLET_MONEY_HPP_
