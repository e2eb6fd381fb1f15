#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace nftreg
{
   /// Quantity of the native value, in its smallest denomination
   using Amount = boost::multiprecision::uint128_t;

   inline const Amount maxAmount = std::numeric_limits<Amount>::max();

   template <std::integral T>
   constexpr bool sumOverflows(T value1, T value2)
   {
      return std::numeric_limits<T>::max() - value2 < value1;
   }

   inline bool sumOverflows(const Amount& value1, const Amount& value2)
   {
      return maxAmount - value2 < value1;
   }

   inline bool productOverflows(const Amount& lhs, const Amount& rhs)
   {
      if (lhs == 0 || rhs == 0)
         return false;
      return maxAmount / lhs < rhs;
   }

   /// Parses a base-10 string. Returns nullopt if the string is empty,
   /// contains anything other than digits, or does not fit in an Amount.
   std::optional<Amount> parseAmount(std::string_view s);

   std::string to_string(const Amount& amount);
}  // namespace nftreg
