#pragma once

#include <nftreg/AccountId.hpp>
#include <nftreg/reflect.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace UserService
{
   using TokenId          = std::string;
   using ApprovalId       = std::uint64_t;
   using ApprovedAccounts = std::map<nftreg::AccountId, ApprovalId>;

   constexpr std::string_view nftMetadataSpec = "nft-1.0.0";

   /// Per-token metadata. The registry stores it at mint and hands it back
   /// unchanged; it never interprets the fields.
   struct TokenMetadata
   {
      std::optional<std::string>   title;
      std::optional<std::string>   description;
      std::optional<std::string>   media;
      std::optional<std::string>   mediaHash;
      std::optional<std::uint64_t> copies;
      std::optional<std::string>   issuedAt;
      std::optional<std::string>   expiresAt;
      std::optional<std::string>   startsAt;
      std::optional<std::string>   updatedAt;
      std::optional<std::string>   extra;
      std::optional<std::string>   reference;
      std::optional<std::string>   referenceHash;

      friend bool operator==(const TokenMetadata&, const TokenMetadata&) = default;
   };
   NFTREG_REFLECT(TokenMetadata,
                  (title)(description)(media)(mediaHash)(copies)(issuedAt)(expiresAt)(startsAt)(
                      updatedAt)(extra)(reference)(referenceHash))

   /// Registry-wide metadata, set once by init
   struct ContractMetadata
   {
      std::string                spec = std::string{nftMetadataSpec};
      std::string                name;
      std::string                symbol;
      std::optional<std::string> icon;
      std::optional<std::string> baseUri;
      std::optional<std::string> reference;
      std::optional<std::string> referenceHash;

      friend bool operator==(const ContractMetadata&, const ContractMetadata&) = default;
   };
   NFTREG_REFLECT(ContractMetadata,
                  (spec)(name)(symbol)(icon)(baseUri)(reference)(referenceHash))

   /// A token as returned by queries
   struct Token
   {
      TokenId                         tokenId;
      nftreg::AccountId               ownerId;
      std::optional<TokenMetadata>    metadata;
      std::optional<ApprovedAccounts> approvedAccountIds;

      friend bool operator==(const Token&, const Token&) = default;
   };
   NFTREG_REFLECT(Token, (tokenId)(ownerId)(metadata)(approvedAccountIds))
}  // namespace UserService
