#pragma once

#include <nftreg/Chain.hpp>
#include <services/user/nftTypes.hpp>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <optional>
#include <string>
#include <vector>

namespace nftreg::json
{
   using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

   // Argument readers. A missing or null optional field reads as nullopt;
   // anything else of the wrong type aborts with the field's name.
   std::string                  getString(const rapidjson::Value& obj, const char* field);
   std::optional<std::string>   getOptString(const rapidjson::Value& obj, const char* field);
   AccountId                    getAccount(const rapidjson::Value& obj, const char* field);
   std::optional<AccountId>     getOptAccount(const rapidjson::Value& obj, const char* field);
   std::optional<std::uint64_t> getOptU64(const rapidjson::Value& obj, const char* field);
   std::optional<Amount>        getOptAmount(const rapidjson::Value& obj, const char* field);

   UserService::TokenMetadata    getTokenMetadata(const rapidjson::Value& obj, const char* field);
   UserService::ContractMetadata getContractMetadata(const rapidjson::Value& obj,
                                                     const char*             field);

   void write(Writer& w, bool value);
   void write(Writer& w, std::uint64_t value);
   void write(Writer& w, const Amount& value);
   void write(Writer& w, const AccountId& value);
   void write(Writer& w, const UserService::TokenMetadata& value);
   void write(Writer& w, const UserService::ContractMetadata& value);
   void write(Writer& w, const UserService::Token& value);
   void write(Writer& w, const std::optional<UserService::Token>& value);
   void write(Writer& w, const std::vector<UserService::Token>& value);

   void writeTraceMembers(Writer& w, const ActionTrace& trace);

   /// Writes the trace as an object; `writeReturn` may add more members
   template <typename F>
   void writeTrace(Writer& w, const ActionTrace& trace, F&& writeReturn)
   {
      w.StartObject();
      writeTraceMembers(w, trace);
      writeReturn(w);
      w.EndObject();
   }
}  // namespace nftreg::json
