#include <catch2/catch.hpp>
#include <nftreg/from_bin.hpp>
#include <nftreg/to_bin.hpp>
#include <nftreg/to_key.hpp>

#include <algorithm>
#include <map>

using namespace nftreg;

namespace
{
   std::vector<unsigned char> bytes(const std::vector<char>& key)
   {
      return {key.begin(), key.end()};
   }

   template <typename T>
   void checkKeyOrder(std::initializer_list<T> items)
   {
      REQUIRE(std::is_sorted(items.begin(), items.end()));
      const T* prev = nullptr;
      for (const auto& item : items)
      {
         if (prev)
         {
            auto prevKey = bytes(convert_to_key(*prev));
            auto key     = bytes(convert_to_key(item));
            CHECK(prevKey < key);
         }
         prev = &item;
      }
   }

   struct Record
   {
      std::string                  name;
      std::uint64_t                count = 0;
      std::optional<AccountId>     account;
      std::map<AccountId, int32_t> weights;

      friend bool operator==(const Record&, const Record&) = default;
   };
   NFTREG_REFLECT(Record, (name)(count)(account)(weights))
}  // namespace

TEST_CASE("integer-keys-preserve-order")
{
   checkKeyOrder<std::uint64_t>({0, 1, 255, 256, 65535, 1ull << 32, ~0ull});
   checkKeyOrder<std::uint8_t>({0, 1, 127, 128, 255});
}

TEST_CASE("string-keys-preserve-order")
{
   using namespace std::literals;
   checkKeyOrder<std::string>({"", "\0"s, "\0\0"s, "\0a"s, "a", "a\0"s, "a\0b"s, "ab", "b", "\xff"});
}

TEST_CASE("composite-keys-separate-fields")
{
   auto k1 = bytes(convert_to_key(std::uint8_t{7}, std::string{"ab"}, std::string{"c"}));
   auto k2 = bytes(convert_to_key(std::uint8_t{7}, std::string{"a"}, std::string{"bc"}));
   CHECK(k1 != k2);
   CHECK(k2 < k1);
}

TEST_CASE("records-survive-binary-encoding")
{
   Record r{"first", 42, AccountId{"alice"}, {{AccountId{"bob"}, -3}, {AccountId{"carol"}, 9}}};
   auto   bin = convert_to_bin(r);
   CHECK(bin.size() == packedSize(r));
   CHECK(from_bin<Record>(bin) == r);

   Amount big = (Amount{1} << 100) + 12345;
   CHECK(from_bin<Amount>(convert_to_bin(big)) == big);
}

TEST_CASE("malformed-binary-is-rejected")
{
   auto bin = convert_to_bin(std::string{"abc"});

   auto truncated = bin;
   truncated.pop_back();
   CHECK_THROWS_WITH(from_bin<std::string>(truncated), "Stream overrun");

   auto extra = bin;
   extra.push_back(0);
   CHECK_THROWS_WITH(from_bin<std::string>(extra), "Extra data after record");

   std::vector<char> badBool{2};
   CHECK_THROWS_WITH(from_bin<bool>(badBool), "Invalid bool encoding");

   std::vector<char> badOptional{5};
   CHECK_THROWS_WITH(from_bin<std::optional<std::uint8_t>>(badOptional),
                     "Invalid optional encoding");
}
