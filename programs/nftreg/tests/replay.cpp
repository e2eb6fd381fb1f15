#include <catch2/catch.hpp>

#include "../json.hpp"
#include "../replay.hpp"

#include <nftreg/check.hpp>
#include <nftreg/log.hpp>

#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace nftreg;

namespace
{
   rapidjson::Document parse(const std::string& text)
   {
      rapidjson::Document doc;
      doc.Parse(text.c_str(), text.size());
      check(!doc.HasParseError(), "bad test json: " + text);
      return doc;
   }

   std::vector<rapidjson::Document> run(Chain& chain, const std::string& script)
   {
      std::ostringstream out;
      replay(chain, parse(script), out);

      std::vector<rapidjson::Document> traces;
      std::istringstream               lines{out.str()};
      for (std::string line; std::getline(lines, line);)
         traces.push_back(parse(line));
      return traces;
   }

   std::string str(const rapidjson::Value& v)
   {
      return {v.GetString(), v.GetStringLength()};
   }

   // 10^24, enough for any single action
   const char* deposit = R"("1000000000000000000000000")";
}  // namespace

TEST_CASE("reading arguments")
{
   auto args = parse(R"({"index": 7, "big": "18446744073709551615", "huge": "18446744073709551616",
                         "negative": -1, "word": "seven", "account": "alice", "none": null})");

   SECTION("indexes may be numbers or decimal strings")
   {
      CHECK(json::getOptU64(args, "index") == 7u);
      CHECK(json::getOptU64(args, "big") == std::numeric_limits<std::uint64_t>::max());
      CHECK(json::getOptU64(args, "missing") == std::nullopt);
      CHECK(json::getOptU64(args, "none") == std::nullopt);
   }
   SECTION("anything else is rejected with the field's name")
   {
      CHECK_THROWS_WITH(json::getOptU64(args, "huge"),
                        "expected a 64-bit unsigned integer for huge");
      CHECK_THROWS_WITH(json::getOptU64(args, "negative"),
                        "expected an unsigned integer for negative");
      CHECK_THROWS_WITH(json::getOptAmount(args, "word"), "expected an unsigned integer for word");
      CHECK_THROWS_WITH(json::getString(args, "index"), "expected a string for index");
      CHECK_THROWS_WITH(json::getAccount(args, "missing"), "expected a string for missing");
   }
   SECTION("amounts beyond 64 bits are read from strings")
   {
      Amount twoTo64 = Amount{std::numeric_limits<std::uint64_t>::max()} + 1;
      CHECK(json::getOptAmount(args, "huge") == twoTo64);
      CHECK(json::getAccount(args, "account") == AccountId{"alice"});
   }
}

TEST_CASE("writing values")
{
   rapidjson::StringBuffer buffer;
   json::Writer            w{buffer};
   w.StartArray();
   json::write(w, maxAmount);
   json::write(w, std::uint64_t{42});
   json::write(w, AccountId{"bob"});
   json::write(w, std::optional<UserService::Token>{});
   w.EndArray();

   CHECK(std::string{buffer.GetString()} ==
         R"(["340282366920938463463374607431768211455",42,"bob",null])");
}

TEST_CASE("replaying a script")
{
   loggers::configure(loggers::level::warning);
   Chain chain;

   auto traces = run(chain, std::string{R"([
      {"sender": "owner", "action": "init_default", "args": {"owner_id": "owner"}},
      {"sender": "owner", "deposit": )"} + deposit + R"(, "action": "mint",
       "args": {"token_id": "0", "receiver_id": "alice", "metadata": {"title": "Zero"}}},
      {"sender": "alice", "action": "fly", "args": {}},
      {"action": "total_supply"},
      {"sender": "Not Valid", "action": "total_supply"},
      {"sender": "owner", "action": "mint", "args": {"token_id": 1, "receiver_id": "bob"}},
      {"sender": "alice", "action": "transfer", "args": {"receiver_id": "carol", "token_id": "0"}},
      {"sender": "bob", "action": "tokens_for_owner",
       "args": {"account_id": "carol", "from_index": "0", "limit": 10}},
      {"sender": "bob", "action": "total_supply"}
   ])"});
   REQUIRE(traces.size() == 9);

   SECTION("every action reports its outcome")
   {
      CHECK(traces[0]["succeeded"].GetBool());
      CHECK(str(traces[0]["action"]) == "init_default");

      CHECK(traces[1]["succeeded"].GetBool());
      CHECK(str(traces[1]["return"]["owner_id"]) == "alice");
      CHECK(str(traces[1]["return"]["metadata"]["title"]) == "Zero");
      CHECK(traces[1]["events"].Size() == 1);
   }
   SECTION("deposits and refunds are printed as decimal strings")
   {
      CHECK(str(traces[1]["deposit"]) == "1000000000000000000000000");
      REQUIRE(traces[1]["refunds"].Size() == 1);
      CHECK(str(traces[1]["refunds"][0]["receiver"]) == "owner");
      CHECK(traces[1]["refunds"][0]["amount"].IsString());
   }
   SECTION("malformed entries fail only themselves")
   {
      CHECK_FALSE(traces[2]["succeeded"].GetBool());
      CHECK(str(traces[2]["error"]) == "unknown action: fly");
      CHECK(str(traces[2]["sender"]) == "alice");

      CHECK_FALSE(traces[3]["succeeded"].GetBool());
      CHECK(str(traces[3]["error"]) == "expected a string for sender");

      CHECK_FALSE(traces[4]["succeeded"].GetBool());
      CHECK(str(traces[4]["error"]) == "invalid sender: Not Valid");

      CHECK_FALSE(traces[5]["succeeded"].GetBool());
      CHECK(str(traces[5]["error"]) == "expected a string for token_id");
      CHECK(traces[5]["refunds"].Size() == 0);
   }
   SECTION("later actions still run")
   {
      CHECK(traces[6]["succeeded"].GetBool());
      REQUIRE(traces[7]["succeeded"].GetBool());
      REQUIRE(traces[7]["return"].IsArray());
      REQUIRE(traces[7]["return"].Size() == 1);
      CHECK(str(traces[7]["return"][0]["token_id"]) == "0");
      CHECK(traces[8]["return"].GetUint64() == 1);
   }
}
