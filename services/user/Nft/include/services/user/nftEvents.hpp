#pragma once

#include <services/user/nftTypes.hpp>

#include <optional>
#include <string>
#include <vector>

namespace UserService
{
   // Standard log format for token events:
   //    EVENT_JSON:{"standard":"nep171","version":"1.0.0","event":...,"data":[...]}
   namespace NftEvents
   {
      constexpr std::string_view prefix   = "EVENT_JSON:";
      constexpr std::string_view standard = "nep171";
      constexpr std::string_view version  = "1.0.0";

      struct Mint
      {
         nftreg::AccountId          ownerId;
         std::vector<TokenId>       tokenIds;
         std::optional<std::string> memo;
      };

      struct Transfer
      {
         nftreg::AccountId                oldOwnerId;
         nftreg::AccountId                newOwnerId;
         std::vector<TokenId>             tokenIds;
         std::optional<nftreg::AccountId> authorizedId;
         std::optional<std::string>       memo;
      };

      struct Burn
      {
         nftreg::AccountId                ownerId;
         std::vector<TokenId>             tokenIds;
         std::optional<nftreg::AccountId> authorizedId;
         std::optional<std::string>       memo;
      };

      std::string toLog(const Mint& event);
      std::string toLog(const Transfer& event);
      std::string toLog(const Burn& event);
   }  // namespace NftEvents
}  // namespace UserService
