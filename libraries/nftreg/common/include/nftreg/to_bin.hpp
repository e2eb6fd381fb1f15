#pragma once

#include <nftreg/AccountId.hpp>
#include <nftreg/Amount.hpp>
#include <nftreg/reflect.hpp>
#include <nftreg/stream.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nftreg
{
   template <typename S>
   void varuint32_to_bin(std::uint64_t val, S& stream)
   {
      check(!(val >> 32), error_to_str(stream_error::varuint_too_big));
      do
      {
         std::uint8_t b = val & 0x7f;
         val >>= 7;
         b |= ((val > 0) << 7);
         stream.write(b);
      } while (val);
   }

   template <typename S>
   void to_bin(std::string_view sv, S& stream)
   {
      varuint32_to_bin(sv.size(), stream);
      stream.write(sv.data(), sv.size());
   }

   template <typename S>
   void to_bin(const std::string& s, S& stream)
   {
      to_bin(std::string_view{s}, stream);
   }

   template <typename S>
   void to_bin(const AccountId& account, S& stream)
   {
      to_bin(std::string_view{account.value}, stream);
   }

   // Amounts are stored as two little-endian 64-bit halves, low half first
   template <typename S>
   void to_bin(const Amount& amount, S& stream)
   {
      std::uint64_t low  = static_cast<std::uint64_t>(amount & Amount{~std::uint64_t{0}});
      std::uint64_t high = static_cast<std::uint64_t>(amount >> 64);
      stream.write_raw(low);
      stream.write_raw(high);
   }

   template <typename T, typename S>
      requires(has_bitwise_serialization<T>())
   void to_bin(const T& obj, S& stream)
   {
      stream.write_raw(obj);
   }

   template <typename T, typename S>
   void to_bin(const std::optional<T>& obj, S& stream);
   template <typename T, typename S>
   void to_bin(const std::vector<T>& obj, S& stream);
   template <typename K, typename V, typename S>
   void to_bin(const std::map<K, V>& obj, S& stream);
   template <Reflected T, typename S>
   void to_bin(const T& obj, S& stream);

   template <typename T, typename S>
   void to_bin(const std::optional<T>& obj, S& stream)
   {
      to_bin(obj.has_value(), stream);
      if (obj)
         to_bin(*obj, stream);
   }

   template <typename T, typename S>
   void to_bin(const std::vector<T>& obj, S& stream)
   {
      varuint32_to_bin(obj.size(), stream);
      for (auto& x : obj)
         to_bin(x, stream);
   }

   template <typename K, typename V, typename S>
   void to_bin(const std::map<K, V>& obj, S& stream)
   {
      varuint32_to_bin(obj.size(), stream);
      for (auto& [k, v] : obj)
      {
         to_bin(k, stream);
         to_bin(v, stream);
      }
   }

   template <Reflected T, typename S>
   void to_bin(const T& obj, S& stream)
   {
      forEachField(obj, [&](const char*, const auto& member) { to_bin(member, stream); });
   }

   template <typename T>
   void convert_to_bin(const T& t, std::vector<char>& bin)
   {
      size_stream ss;
      to_bin(t, ss);
      auto orig_size = bin.size();
      bin.reserve(orig_size + ss.size);
      vector_stream vs{bin};
      to_bin(t, vs);
   }

   template <typename T>
   std::vector<char> convert_to_bin(const T& t)
   {
      std::vector<char> result;
      convert_to_bin(t, result);
      return result;
   }

   template <typename T>
   std::size_t packedSize(const T& t)
   {
      size_stream ss;
      to_bin(t, ss);
      return ss.size;
   }
}  // namespace nftreg
