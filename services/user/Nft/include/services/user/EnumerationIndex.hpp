#pragma once

#include <nftreg/KvStore.hpp>
#include <nftreg/Table.hpp>
#include <services/user/nftTypes.hpp>

#include <optional>
#include <vector>

namespace UserService
{
   /// Secondary indexes over the ownership record: all tokens, and the
   /// tokens of each owner, both ordered by token id.
   ///
   /// The `on*` hooks must be called exactly once for each matching change
   /// to the OwnershipStore, within the same action.
   class EnumerationIndex
   {
     public:
      virtual ~EnumerationIndex() = default;

      virtual void onMint(const TokenId& tokenId, const nftreg::AccountId& owner) = 0;
      virtual void onTransfer(const TokenId&           tokenId,
                              const nftreg::AccountId& oldOwner,
                              const nftreg::AccountId& newOwner)                  = 0;
      virtual void onBurn(const TokenId& tokenId, const nftreg::AccountId& owner) = 0;

      /// Page through all tokens. `fromIndex` defaults to 0 and may not exceed
      /// the number of tokens; `limit` defaults to unlimited and may not be 0.
      virtual std::vector<TokenId> tokens(std::optional<std::uint64_t> fromIndex,
                                          std::optional<std::uint64_t> limit) const = 0;

      /// Page through the tokens of `owner`, with the same rules as [tokens].
      /// An owner without tokens has an empty page.
      virtual std::vector<TokenId> tokensForOwner(const nftreg::AccountId&     owner,
                                                  std::optional<std::uint64_t> fromIndex,
                                                  std::optional<std::uint64_t> limit) const = 0;

      virtual std::uint64_t totalSupply() const                                = 0;
      virtual std::uint64_t supplyForOwner(const nftreg::AccountId& owner) const = 0;
   };

   class KvEnumerationIndex : public EnumerationIndex
   {
     public:
      explicit KvEnumerationIndex(nftreg::KvStore& kv);

      void onMint(const TokenId& tokenId, const nftreg::AccountId& owner) override;
      void onTransfer(const TokenId&           tokenId,
                      const nftreg::AccountId& oldOwner,
                      const nftreg::AccountId& newOwner) override;
      void onBurn(const TokenId& tokenId, const nftreg::AccountId& owner) override;

      std::vector<TokenId> tokens(std::optional<std::uint64_t> fromIndex,
                                  std::optional<std::uint64_t> limit) const override;
      std::vector<TokenId> tokensForOwner(const nftreg::AccountId&     owner,
                                          std::optional<std::uint64_t> fromIndex,
                                          std::optional<std::uint64_t> limit) const override;
      std::uint64_t        totalSupply() const override;
      std::uint64_t        supplyForOwner(const nftreg::AccountId& owner) const override;

     private:
      void addToOwner(const TokenId& tokenId, const nftreg::AccountId& owner);
      void removeFromOwner(const TokenId& tokenId, const nftreg::AccountId& owner);

      nftreg::Index<nftreg::SingletonKey, TokenId>      allTokens;
      nftreg::Index<nftreg::AccountId, TokenId>         tokensPerOwner;
      nftreg::Table<nftreg::SingletonKey, std::uint64_t> supply;
      nftreg::Table<nftreg::AccountId, std::uint64_t>    supplyPerOwner;
   };
}  // namespace UserService
