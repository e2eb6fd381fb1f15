#include "json.hpp"

#include <nftreg/check.hpp>

#include <limits>

using namespace UserService;

namespace nftreg::json
{
   namespace
   {
      template <typename T, typename F>
      void tokenMetadataFields(T& md, F&& f)
      {
         f("title", md.title);
         f("description", md.description);
         f("media", md.media);
         f("media_hash", md.mediaHash);
         f("copies", md.copies);
         f("issued_at", md.issuedAt);
         f("expires_at", md.expiresAt);
         f("starts_at", md.startsAt);
         f("updated_at", md.updatedAt);
         f("extra", md.extra);
         f("reference", md.reference);
         f("reference_hash", md.referenceHash);
      }

      template <typename T, typename F>
      void contractMetadataOptionalFields(T& md, F&& f)
      {
         f("icon", md.icon);
         f("base_uri", md.baseUri);
         f("reference", md.reference);
         f("reference_hash", md.referenceHash);
      }

      const rapidjson::Value* find(const rapidjson::Value& obj, const char* field)
      {
         check(obj.IsObject(), "expected an object");
         auto it = obj.FindMember(field);
         if (it == obj.MemberEnd() || it->value.IsNull())
            return nullptr;
         return &it->value;
      }

      [[noreturn]] void badField(const char* field, const char* expected)
      {
         abortMessage(std::string{"expected "} + expected + " for " + field);
      }

      void read(const rapidjson::Value& obj, const char* field, std::optional<std::string>& out)
      {
         out = getOptString(obj, field);
      }

      void read(const rapidjson::Value& obj, const char* field, std::optional<std::uint64_t>& out)
      {
         out = getOptU64(obj, field);
      }

      void writeString(Writer& w, std::string_view s)
      {
         w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
      }

      void writeMember(Writer& w, const char* key, const std::optional<std::string>& value)
      {
         w.Key(key);
         if (value)
            writeString(w, *value);
         else
            w.Null();
      }

      void writeMember(Writer& w, const char* key, const std::optional<std::uint64_t>& value)
      {
         w.Key(key);
         if (value)
            w.Uint64(*value);
         else
            w.Null();
      }
   }  // namespace

   std::string getString(const rapidjson::Value& obj, const char* field)
   {
      auto s = getOptString(obj, field);
      if (!s)
         badField(field, "a string");
      return std::move(*s);
   }

   std::optional<std::string> getOptString(const rapidjson::Value& obj, const char* field)
   {
      auto value = find(obj, field);
      if (!value)
         return std::nullopt;
      if (!value->IsString())
         badField(field, "a string");
      return std::string{value->GetString(), value->GetStringLength()};
   }

   AccountId getAccount(const rapidjson::Value& obj, const char* field)
   {
      return AccountId{getString(obj, field)};
   }

   std::optional<AccountId> getOptAccount(const rapidjson::Value& obj, const char* field)
   {
      if (auto s = getOptString(obj, field))
         return AccountId{*s};
      return std::nullopt;
   }

   // Indexes may be given as numbers or as decimal strings
   std::optional<std::uint64_t> getOptU64(const rapidjson::Value& obj, const char* field)
   {
      auto amount = getOptAmount(obj, field);
      if (!amount)
         return std::nullopt;
      if (*amount > std::numeric_limits<std::uint64_t>::max())
         badField(field, "a 64-bit unsigned integer");
      return static_cast<std::uint64_t>(*amount);
   }

   std::optional<Amount> getOptAmount(const rapidjson::Value& obj, const char* field)
   {
      auto value = find(obj, field);
      if (!value)
         return std::nullopt;
      if (value->IsUint64())
         return Amount{value->GetUint64()};
      if (value->IsString())
      {
         if (auto amount = parseAmount({value->GetString(), value->GetStringLength()}))
            return amount;
      }
      badField(field, "an unsigned integer");
   }

   TokenMetadata getTokenMetadata(const rapidjson::Value& obj, const char* field)
   {
      TokenMetadata result;
      if (auto value = find(obj, field))
         tokenMetadataFields(result, [&](const char* name, auto& member)
                             { read(*value, name, member); });
      return result;
   }

   ContractMetadata getContractMetadata(const rapidjson::Value& obj, const char* field)
   {
      auto value = find(obj, field);
      if (!value)
         badField(field, "an object");

      ContractMetadata result;
      if (auto spec = getOptString(*value, "spec"))
         result.spec = std::move(*spec);
      result.name   = getString(*value, "name");
      result.symbol = getString(*value, "symbol");
      contractMetadataOptionalFields(result, [&](const char* name, auto& member)
                                     { read(*value, name, member); });
      return result;
   }

   void write(Writer& w, bool value)
   {
      w.Bool(value);
   }

   void write(Writer& w, std::uint64_t value)
   {
      w.Uint64(value);
   }

   // Amounts don't fit in a JSON number
   void write(Writer& w, const Amount& value)
   {
      writeString(w, to_string(value));
   }

   void write(Writer& w, const AccountId& value)
   {
      writeString(w, value.str());
   }

   void write(Writer& w, const TokenMetadata& value)
   {
      w.StartObject();
      tokenMetadataFields(value, [&](const char* name, const auto& member)
                          { writeMember(w, name, member); });
      w.EndObject();
   }

   void write(Writer& w, const ContractMetadata& value)
   {
      w.StartObject();
      w.Key("spec");
      writeString(w, value.spec);
      w.Key("name");
      writeString(w, value.name);
      w.Key("symbol");
      writeString(w, value.symbol);
      contractMetadataOptionalFields(value, [&](const char* name, const auto& member)
                                     { writeMember(w, name, member); });
      w.EndObject();
   }

   void write(Writer& w, const Token& value)
   {
      w.StartObject();
      w.Key("token_id");
      writeString(w, value.tokenId);
      w.Key("owner_id");
      write(w, value.ownerId);
      w.Key("metadata");
      if (value.metadata)
         write(w, *value.metadata);
      else
         w.Null();
      w.Key("approved_account_ids");
      if (value.approvedAccountIds)
      {
         w.StartObject();
         for (const auto& [account, id] : *value.approvedAccountIds)
         {
            writeString(w, account.str());
            w.Uint64(id);
         }
         w.EndObject();
      }
      else
      {
         w.Null();
      }
      w.EndObject();
   }

   void write(Writer& w, const std::optional<Token>& value)
   {
      if (value)
         write(w, *value);
      else
         w.Null();
   }

   void write(Writer& w, const std::vector<Token>& value)
   {
      w.StartArray();
      for (const auto& token : value)
         write(w, token);
      w.EndArray();
   }

   void writeTraceMembers(Writer& w, const ActionTrace& trace)
   {
      w.Key("action");
      writeString(w, trace.method);
      w.Key("sender");
      write(w, trace.sender);
      w.Key("deposit");
      write(w, trace.attachedDeposit);
      w.Key("succeeded");
      w.Bool(!trace.error);
      if (trace.error)
      {
         w.Key("error");
         writeString(w, *trace.error);
      }
      w.Key("refunds");
      w.StartArray();
      for (const auto& transfer : trace.transfers)
      {
         w.StartObject();
         w.Key("receiver");
         write(w, transfer.receiver);
         w.Key("amount");
         write(w, transfer.amount);
         w.EndObject();
      }
      w.EndArray();
      w.Key("events");
      w.StartArray();
      for (const auto& event : trace.events)
         writeString(w, event);
      w.EndArray();
      w.Key("storage_before");
      w.Uint64(trace.storageBefore);
      w.Key("storage_after");
      w.Uint64(trace.storageAfter);
   }
}  // namespace nftreg::json
