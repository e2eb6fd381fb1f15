#pragma once

#include <nftreg/AccountId.hpp>

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nftreg
{
   // Keys are encoded so that byte-wise comparison of the encoded keys matches
   // the ordering of the original values.
   //
   // - unsigned integers are big-endian
   // - strings escape `\0` as `\0\1` and end with `\0\0`, so a string is always
   //   ordered before any longer string that it is a prefix of, and a composite
   //   key never confuses where one string ends and the next field begins

   template <std::unsigned_integral T>
   void to_key(T value, std::vector<char>& out)
   {
      for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8)
         out.push_back(static_cast<char>((value >> shift) & 0xff));
   }

   inline void to_key(std::string_view s, std::vector<char>& out)
   {
      for (char ch : s)
      {
         out.push_back(ch);
         if (ch == '\0')
            out.push_back('\1');
      }
      out.push_back('\0');
      out.push_back('\0');
   }

   inline void to_key(const std::string& s, std::vector<char>& out)
   {
      to_key(std::string_view{s}, out);
   }

   inline void to_key(const AccountId& account, std::vector<char>& out)
   {
      to_key(std::string_view{account.value}, out);
   }

   template <typename... Ts>
   std::vector<char> convert_to_key(const Ts&... fields)
   {
      std::vector<char> result;
      (to_key(fields, result), ...);
      return result;
   }
}  // namespace nftreg
