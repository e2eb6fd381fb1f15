#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace nftreg
{
   struct KvEntry
   {
      std::vector<char> key;
      std::vector<char> value;
   };

   /// Persistent key-value storage owned by the registry
   ///
   /// Keys are compared byte-wise (unsigned). Every stored record is charged
   /// for its key, its value and a fixed per-record overhead; [storageUsage]
   /// reports the total.
   class KvStore
   {
     public:
      virtual ~KvStore() = default;

      virtual std::optional<std::vector<char>> get(std::span<const char> key) const = 0;
      virtual void put(std::span<const char> key, std::span<const char> value)      = 0;
      virtual void remove(std::span<const char> key)                                = 0;

      /// Returns the first entry with a key `>= key`, if the first
      /// `matchKeySize` bytes of that key equal the first `matchKeySize`
      /// bytes of `key`.
      virtual std::optional<KvEntry> greaterEqual(std::span<const char> key,
                                                  std::size_t           matchKeySize) const = 0;

      /// Total bytes currently consumed
      virtual std::uint64_t storageUsage() const = 0;
   };
}  // namespace nftreg
