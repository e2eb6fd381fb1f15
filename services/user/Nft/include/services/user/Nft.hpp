#pragma once

#include <nftreg/Host.hpp>

#include <services/user/ApprovalStore.hpp>
#include <services/user/EnumerationIndex.hpp>
#include <services/user/MetadataStore.hpp>
#include <services/user/OwnershipStore.hpp>
#include <services/user/StorageAccountant.hpp>
#include <services/user/nftErrors.hpp>
#include <services/user/nftTables.hpp>
#include <services/user/nftTypes.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace UserService
{
   /// The stores behind the registry
   struct NftStores
   {
      std::unique_ptr<OwnershipStore>   ownership;
      std::unique_ptr<ApprovalStore>    approvals;
      std::unique_ptr<EnumerationIndex> enumeration;
      std::unique_ptr<MetadataStore>    metadata;

      /// Stores which keep their records in `kv`
      static NftStores kv(nftreg::KvStore& kv);
   };

   /// Registry of non-fungible tokens
   ///
   /// One instance serves one action. Every mutating action validates its
   /// arguments against the stores before writing, then settles the change
   /// in storage usage against the deposit attached to the action. Any
   /// failure aborts the whole action.
   class Nft
   {
     public:
      static constexpr std::string_view service = "nft";

      Nft(nftreg::Host& host, std::string_view method);
      Nft(nftreg::Host& host, std::string_view method, NftStores stores);

      void init(nftreg::AccountId ownerId, ContractMetadata metadata);
      /// init with defaultContractMetadata()
      void initDefault(nftreg::AccountId ownerId);

      Token mint(TokenId                    tokenId,
                 nftreg::AccountId          receiver,
                 TokenMetadata              metadata,
                 std::optional<std::string> memo);
      /// mint with defaultTokenMetadata()
      Token mintDefault(TokenId tokenId, nftreg::AccountId receiver);

      void transfer(nftreg::AccountId                receiver,
                    TokenId                          tokenId,
                    std::optional<nftreg::AccountId> expectedOwner,
                    std::optional<ApprovalId>        approvalId,
                    std::optional<std::string>       memo);

      ApprovalId approve(TokenId tokenId, nftreg::AccountId account, std::optional<std::string> msg);
      void       revoke(TokenId tokenId, nftreg::AccountId account);
      void       revokeAll(TokenId tokenId);
      void       burn(TokenId tokenId, std::optional<std::string> memo);

      // Read-only:
      bool isApproved(TokenId                   tokenId,
                      nftreg::AccountId         account,
                      std::optional<ApprovalId> approvalId);
      std::optional<Token> getToken(TokenId tokenId);
      std::vector<Token>   tokens(std::optional<std::uint64_t> fromIndex,
                                  std::optional<std::uint64_t> limit);
      std::vector<Token>   tokensForOwner(nftreg::AccountId            account,
                                          std::optional<std::uint64_t> fromIndex,
                                          std::optional<std::uint64_t> limit);
      std::uint64_t        supplyForOwner(nftreg::AccountId account);
      std::uint64_t        totalSupply();
      ContractMetadata     metadata();

      static ContractMetadata defaultContractMetadata();
      static TokenMetadata    defaultTokenMetadata();

     private:
      InitRecord        getInit();
      nftreg::AccountId requireOwner(const TokenId& tokenId);
      Token             makeToken(const TokenId& tokenId, nftreg::AccountId owner);
      void              settleStorage(std::uint64_t initialStorage,
                                      Growth        growth = Growth::charged);

      nftreg::Host* host;
      NftStores     stores;
   };
}  // namespace UserService
