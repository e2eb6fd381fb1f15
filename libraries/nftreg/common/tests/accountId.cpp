#include <catch2/catch.hpp>
#include <nftreg/AccountId.hpp>

using namespace nftreg;

TEST_CASE("valid-account-ids")
{
   CHECK(isValidAccountId("alice"));
   CHECK(isValidAccountId("ab"));
   CHECK(isValidAccountId("alice.near"));
   CHECK(isValidAccountId("a-b_c.d"));
   CHECK(isValidAccountId("0xdeadbeef"));
   CHECK(isValidAccountId(std::string(64, 'a')));
   CHECK("bob"_a.isValid());
}

TEST_CASE("invalid-account-ids")
{
   CHECK(!isValidAccountId(""));
   CHECK(!isValidAccountId("a"));
   CHECK(!isValidAccountId(std::string(65, 'a')));
   CHECK(!isValidAccountId("Alice"));
   CHECK(!isValidAccountId("al ice"));
   CHECK(!isValidAccountId("-alice"));
   CHECK(!isValidAccountId("alice."));
   CHECK(!isValidAccountId("al..ice"));
   CHECK(!isValidAccountId("al-_ice"));
   CHECK(!isValidAccountId("what?"));
   CHECK(!AccountId{}.isValid());
}

TEST_CASE("account-ids-order-by-name")
{
   CHECK("alice"_a < "bob"_a);
   CHECK("bob"_a < "bobby"_a);
   CHECK("carol"_a == AccountId{"carol"});
}
