#pragma once
#include <compare>
#include <string>
#include <string_view>

namespace nftreg
{
   /// An account name
   ///
   /// Account ids are 2 to 64 characters long and contain the
   /// characters `a-z`, `0-9`, and the separators `-`, `_` and `.`.
   /// A separator may not begin or end the id and may not follow
   /// another separator.
   ///
   /// Construction does no checking; use [isValid] or
   /// [isValidAccountId] before trusting an id that came from
   /// outside the registry.
   struct AccountId
   {
      static constexpr std::size_t minLength = 2;
      static constexpr std::size_t maxLength = 64;

      std::string value;

      /// Construct the empty id
      AccountId() = default;

      explicit AccountId(std::string_view s) : value(s) {}

      const std::string& str() const { return value; }
      bool               empty() const { return value.empty(); }
      bool               isValid() const;

      /// Comparisons
      ///
      /// Compares by byte value of the name
      friend auto operator<=>(const AccountId&, const AccountId&) = default;
   };

   bool isValidAccountId(std::string_view s);

   inline bool AccountId::isValid() const
   {
      return isValidAccountId(value);
   }

   inline namespace literals
   {
      inline AccountId operator""_a(const char* s, unsigned long len)
      {
         return AccountId{std::string_view{s, len}};
      }
   }  // namespace literals
}  // namespace nftreg
