#pragma once

#include <nftreg/check.hpp>

#include <string.h>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace nftreg
{
   enum class stream_error
   {
      no_error,
      overrun,
      underrun,
      varuint_too_big,
      invalid_bool,
      invalid_optional,
      extra_data,
   };  // stream_error

   constexpr inline std::string_view error_to_str(stream_error e)
   {
      switch (e)
      {
            // clang-format off
         case stream_error::no_error:          return "No error";
         case stream_error::overrun:           return "Stream overrun";
         case stream_error::underrun:          return "Stream underrun";
         case stream_error::varuint_too_big:   return "Varuint too big";
         case stream_error::invalid_bool:      return "Invalid bool encoding";
         case stream_error::invalid_optional:  return "Invalid optional encoding";
         case stream_error::extra_data:        return "Extra data after record";
            // clang-format on

         default:
            return "unknown";
      }
   }

   [[noreturn]] inline void abort_error(stream_error e)
   {
      abortMessage(error_to_str(e));
   }

   template <typename T>
   constexpr bool has_bitwise_serialization()
   {
      if constexpr (std::is_arithmetic_v<T>)
      {
         return true;
      }
      else if constexpr (std::is_enum_v<T>)
      {
         static_assert(!std::is_convertible_v<T, std::underlying_type_t<T>>,
                       "Serializing unscoped enum");
         return true;
      }
      else
      {
         return false;
      }
   }

   // Appends to a vector
   struct vector_stream
   {
      std::vector<char>& data;

      explicit vector_stream(std::vector<char>& data) : data(data) {}

      void write(char ch) { data.push_back(ch); }
      void write(const void* src, std::size_t size)
      {
         auto s = reinterpret_cast<const char*>(src);
         data.insert(data.end(), s, s + size);
      }
      template <typename T>
      void write_raw(const T& v)
      {
         write(&v, sizeof(v));
      }
   };

   // Counts bytes without writing them
   struct size_stream
   {
      std::size_t size = 0;

      void write(char) { ++size; }
      void write(const void*, std::size_t s) { size += s; }
      template <typename T>
      void write_raw(const T&)
      {
         size += sizeof(T);
      }
   };

   struct input_stream
   {
      const char* pos;
      const char* end;

      input_stream() : pos{nullptr}, end{nullptr} {}
      input_stream(const char* pos, std::size_t size) : pos{pos}, end{pos + size} {}
      input_stream(std::span<const char> s) : pos{s.data()}, end{s.data() + s.size()} {}
      input_stream(const std::vector<char>& v) : pos{v.data()}, end{v.data() + v.size()} {}

      std::size_t remaining() const { return end - pos; }

      void check_available(std::size_t size) const
      {
         if (size > remaining())
            abort_error(stream_error::overrun);
      }

      void read(void* dest, std::size_t size)
      {
         check_available(size);
         memcpy(dest, pos, size);
         pos += size;
      }

      template <typename T>
      void read_raw(T& dest)
      {
         static_assert(has_bitwise_serialization<T>());
         read(&dest, sizeof(dest));
      }

      std::string_view read_view(std::size_t size)
      {
         check_available(size);
         std::string_view result{pos, size};
         pos += size;
         return result;
      }
   };
}  // namespace nftreg
