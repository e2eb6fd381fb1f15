#include <catch2/catch.hpp>
#include <nftreg/MemoryDatabase.hpp>

#include <string>

using namespace nftreg;

namespace
{
   std::vector<char> bytes(std::string_view s)
   {
      return {s.begin(), s.end()};
   }
}  // namespace

TEST_CASE("storage usage counts keys, values and overhead")
{
   MemoryDatabase db{DatabaseConfig{.recordOverhead = 40, .baseUsage = 100}};
   CHECK(db.storageUsage() == 100);

   db.put(bytes("key"), bytes("value"));
   CHECK(db.storageUsage() == 100 + 3 + 5 + 40);

   db.put(bytes("key"), bytes("v"));
   CHECK(db.storageUsage() == 100 + 3 + 1 + 40);

   db.put(bytes("other"), bytes(""));
   CHECK(db.storageUsage() == 100 + 3 + 1 + 40 + 5 + 40);
   CHECK(db.numRecords() == 2);

   db.remove(bytes("key"));
   db.remove(bytes("missing"));
   CHECK(db.storageUsage() == 100 + 5 + 40);
   CHECK(!db.get(bytes("key")));
   CHECK(db.get(bytes("other")) == bytes(""));
}

TEST_CASE("aborted sessions leave no trace")
{
   MemoryDatabase db;
   db.put(bytes("a"), bytes("1"));
   db.put(bytes("b"), bytes("2"));
   auto usage = db.storageUsage();

   {
      auto session = db.startWrite();
      db.put(bytes("a"), bytes("changed"));
      db.remove(bytes("b"));
      db.put(bytes("c"), bytes("3"));
      db.put(bytes("c"), bytes("33"));
   }

   CHECK(db.get(bytes("a")) == bytes("1"));
   CHECK(db.get(bytes("b")) == bytes("2"));
   CHECK(!db.get(bytes("c")));
   CHECK(db.storageUsage() == usage);
   CHECK(db.numRecords() == 2);
}

TEST_CASE("committed sessions keep their writes")
{
   MemoryDatabase db;
   {
      auto session = db.startWrite();
      db.put(bytes("a"), bytes("1"));
      session.commit();
   }
   CHECK(db.get(bytes("a")) == bytes("1"));
}

TEST_CASE("inner sessions fold into outer sessions")
{
   MemoryDatabase db;
   {
      auto outer = db.startWrite();
      db.put(bytes("a"), bytes("1"));
      {
         auto inner = db.startWrite();
         db.put(bytes("b"), bytes("2"));
         inner.commit();
      }
      {
         auto inner = db.startWrite();
         db.put(bytes("c"), bytes("3"));
      }
      CHECK(db.get(bytes("b")));
      CHECK(!db.get(bytes("c")));
   }
   CHECK(!db.get(bytes("a")));
   CHECK(!db.get(bytes("b")));
   CHECK(db.storageUsage() == 0);
}

TEST_CASE("greaterEqual respects the prefix")
{
   MemoryDatabase db;
   db.put(bytes("a1"), bytes("x"));
   db.put(bytes("b1"), bytes("y"));
   db.put(bytes("b2"), bytes("z"));
   db.put(std::vector<char>{'b', char(0xff)}, bytes("high"));
   db.put(bytes("c1"), bytes("w"));

   auto first = db.greaterEqual(bytes("b"), 1);
   REQUIRE(first);
   CHECK(first->key == bytes("b1"));
   CHECK(first->value == bytes("y"));

   auto next = db.greaterEqual(bytes("b2"), 1);
   REQUIRE(next);
   CHECK(next->key == bytes("b2"));

   // Keys compare as unsigned bytes
   auto high = db.greaterEqual(bytes("b3"), 1);
   REQUIRE(high);
   CHECK(high->value == bytes("high"));

   CHECK(!db.greaterEqual(bytes("c2"), 1));
   CHECK(!db.greaterEqual(bytes("bz"), 2));

   auto any = db.greaterEqual(bytes(""), 0);
   REQUIRE(any);
   CHECK(any->key == bytes("a1"));
}
