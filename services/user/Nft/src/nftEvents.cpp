#include <services/user/nftEvents.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

using namespace UserService;
using nftreg::AccountId;

namespace
{
   using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

   void string(Writer& w, std::string_view s)
   {
      w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
   }

   void field(Writer& w, std::string_view key, std::string_view value)
   {
      string(w, key);
      string(w, value);
   }

   void optionalField(Writer& w, std::string_view key, const std::optional<std::string>& value)
   {
      if (value)
         field(w, key, *value);
   }

   void optionalField(Writer& w, std::string_view key, const std::optional<AccountId>& value)
   {
      if (value)
         field(w, key, value->str());
   }

   void arrayField(Writer& w, std::string_view key, const std::vector<TokenId>& ids)
   {
      string(w, key);
      w.StartArray();
      for (const auto& id : ids)
         string(w, id);
      w.EndArray();
   }

   // Writes the envelope around a single data entry filled in by `fill`
   template <typename F>
   std::string render(std::string_view event, F&& fill)
   {
      rapidjson::StringBuffer buffer;
      Writer                  w{buffer};
      w.StartObject();
      field(w, "standard", NftEvents::standard);
      field(w, "version", NftEvents::version);
      field(w, "event", event);
      string(w, "data");
      w.StartArray();
      w.StartObject();
      fill(w);
      w.EndObject();
      w.EndArray();
      w.EndObject();

      std::string result{NftEvents::prefix};
      result.append(buffer.GetString(), buffer.GetSize());
      return result;
   }
}  // namespace

std::string NftEvents::toLog(const Mint& event)
{
   return render("nft_mint",
                 [&](Writer& w)
                 {
                    field(w, "owner_id", event.ownerId.str());
                    arrayField(w, "token_ids", event.tokenIds);
                    optionalField(w, "memo", event.memo);
                 });
}

std::string NftEvents::toLog(const Transfer& event)
{
   return render("nft_transfer",
                 [&](Writer& w)
                 {
                    optionalField(w, "authorized_id", event.authorizedId);
                    field(w, "old_owner_id", event.oldOwnerId.str());
                    field(w, "new_owner_id", event.newOwnerId.str());
                    arrayField(w, "token_ids", event.tokenIds);
                    optionalField(w, "memo", event.memo);
                 });
}

std::string NftEvents::toLog(const Burn& event)
{
   return render("nft_burn",
                 [&](Writer& w)
                 {
                    field(w, "owner_id", event.ownerId.str());
                    optionalField(w, "authorized_id", event.authorizedId);
                    arrayField(w, "token_ids", event.tokenIds);
                    optionalField(w, "memo", event.memo);
                 });
}
