#include <nftreg/Amount.hpp>

namespace nftreg
{
   std::optional<Amount> parseAmount(std::string_view s)
   {
      if (s.empty())
         return std::nullopt;

      Amount result = 0;
      for (char ch : s)
      {
         if (ch < '0' || ch > '9')
            return std::nullopt;
         if (productOverflows(result, Amount{10}))
            return std::nullopt;
         result *= 10;
         Amount digit = static_cast<unsigned>(ch - '0');
         if (sumOverflows(result, digit))
            return std::nullopt;
         result += digit;
      }
      return result;
   }

   std::string to_string(const Amount& amount)
   {
      return amount.str();
   }
}  // namespace nftreg
