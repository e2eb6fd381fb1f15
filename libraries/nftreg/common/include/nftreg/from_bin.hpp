#pragma once

#include <nftreg/AccountId.hpp>
#include <nftreg/Amount.hpp>
#include <nftreg/reflect.hpp>
#include <nftreg/stream.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nftreg
{
   template <typename S>
   std::uint32_t varuint32_from_bin(S& stream)
   {
      std::uint32_t result = 0;
      int           shift  = 0;
      std::uint8_t  b      = 0;
      do
      {
         if (shift >= 35)
            abort_error(stream_error::varuint_too_big);
         stream.read_raw(b);
         result |= std::uint32_t(b & 0x7f) << shift;
         shift += 7;
      } while (b & 0x80);
      return result;
   }

   template <typename S>
   void from_bin(std::string& obj, S& stream)
   {
      auto size = varuint32_from_bin(stream);
      obj       = std::string{stream.read_view(size)};
   }

   template <typename S>
   void from_bin(AccountId& obj, S& stream)
   {
      from_bin(obj.value, stream);
   }

   template <typename S>
   void from_bin(bool& obj, S& stream)
   {
      std::uint8_t b;
      stream.read_raw(b);
      if (b > 1)
         abort_error(stream_error::invalid_bool);
      obj = b;
   }

   template <typename S>
   void from_bin(Amount& obj, S& stream)
   {
      std::uint64_t low, high;
      stream.read_raw(low);
      stream.read_raw(high);
      obj = Amount{high};
      obj <<= 64;
      obj |= low;
   }

   template <typename T, typename S>
      requires(has_bitwise_serialization<T>() && !std::is_same_v<T, bool>)
   void from_bin(T& obj, S& stream)
   {
      stream.read_raw(obj);
   }

   template <typename T, typename S>
   void from_bin(std::optional<T>& obj, S& stream);
   template <typename T, typename S>
   void from_bin(std::vector<T>& obj, S& stream);
   template <typename K, typename V, typename S>
   void from_bin(std::map<K, V>& obj, S& stream);
   template <Reflected T, typename S>
   void from_bin(T& obj, S& stream);

   template <typename T, typename S>
   void from_bin(std::optional<T>& obj, S& stream)
   {
      std::uint8_t present;
      stream.read_raw(present);
      if (present > 1)
         abort_error(stream_error::invalid_optional);
      if (present)
      {
         obj.emplace();
         from_bin(*obj, stream);
      }
      else
      {
         obj.reset();
      }
   }

   template <typename T, typename S>
   void from_bin(std::vector<T>& obj, S& stream)
   {
      auto size = varuint32_from_bin(stream);
      obj.clear();
      for (std::uint32_t i = 0; i < size; ++i)
         from_bin(obj.emplace_back(), stream);
   }

   template <typename K, typename V, typename S>
   void from_bin(std::map<K, V>& obj, S& stream)
   {
      auto size = varuint32_from_bin(stream);
      obj.clear();
      for (std::uint32_t i = 0; i < size; ++i)
      {
         K key;
         V value;
         from_bin(key, stream);
         from_bin(value, stream);
         obj.insert_or_assign(std::move(key), std::move(value));
      }
   }

   template <Reflected T, typename S>
   void from_bin(T& obj, S& stream)
   {
      forEachField(obj, [&](const char*, auto& member) { from_bin(member, stream); });
   }

   template <typename T>
   T from_bin(input_stream stream)
   {
      T result{};
      from_bin(result, stream);
      if (stream.remaining())
         abort_error(stream_error::extra_data);
      return result;
   }
}  // namespace nftreg
