#pragma once

#include <nftreg/KvStore.hpp>
#include <nftreg/Table.hpp>
#include <services/user/nftTypes.hpp>

#include <optional>

namespace UserService
{
   /// Holds the metadata of each token. Written once at mint; the registry
   /// never modifies it afterwards.
   class MetadataStore
   {
     public:
      virtual ~MetadataStore() = default;

      virtual void put(const TokenId& tokenId, const TokenMetadata& metadata) = 0;
      virtual std::optional<TokenMetadata> get(const TokenId& tokenId) const = 0;
      virtual void                         erase(const TokenId& tokenId)    = 0;
   };

   class KvMetadataStore : public MetadataStore
   {
     public:
      explicit KvMetadataStore(nftreg::KvStore& kv);

      void put(const TokenId& tokenId, const TokenMetadata& metadata) override;
      std::optional<TokenMetadata> get(const TokenId& tokenId) const override;
      void                         erase(const TokenId& tokenId) override;

     private:
      nftreg::Table<TokenId, TokenMetadata> metadataById;
   };
}  // namespace UserService
