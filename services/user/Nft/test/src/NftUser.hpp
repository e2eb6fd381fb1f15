#pragma once

#include <nftreg/tester.hpp>
#include <services/user/Nft.hpp>

template <>
struct nftreg::ServiceUser<UserService::Nft>
{
   using Nft = UserService::Nft;

   TestChain::CallProxy proxy;

   auto init(AccountId ownerId, UserService::ContractMetadata metadata) const
   {
      return proxy.call<Nft>("init", [&](Nft& s) { s.init(ownerId, metadata); });
   }

   auto initDefault(AccountId ownerId) const
   {
      return proxy.call<Nft>("initDefault", [&](Nft& s) { s.initDefault(ownerId); });
   }

   auto mint(UserService::TokenId       tokenId,
             AccountId                  receiver,
             UserService::TokenMetadata metadata = {},
             std::optional<std::string> memo     = std::nullopt) const
   {
      return proxy.call<Nft>("mint", [&](Nft& s)
                             { return s.mint(tokenId, receiver, metadata, memo); });
   }

   auto mintDefault(UserService::TokenId tokenId, AccountId receiver) const
   {
      return proxy.call<Nft>("mintDefault",
                             [&](Nft& s) { return s.mintDefault(tokenId, receiver); });
   }

   auto transfer(AccountId                               receiver,
                 UserService::TokenId                    tokenId,
                 std::optional<AccountId>                expectedOwner = std::nullopt,
                 std::optional<UserService::ApprovalId> approvalId    = std::nullopt,
                 std::optional<std::string>              memo          = std::nullopt) const
   {
      return proxy.call<Nft>("transfer", [&](Nft& s)
                             { s.transfer(receiver, tokenId, expectedOwner, approvalId, memo); });
   }

   auto approve(UserService::TokenId       tokenId,
                AccountId                  account,
                std::optional<std::string> msg = std::nullopt) const
   {
      return proxy.call<Nft>("approve",
                             [&](Nft& s) { return s.approve(tokenId, account, msg); });
   }

   auto revoke(UserService::TokenId tokenId, AccountId account) const
   {
      return proxy.call<Nft>("revoke", [&](Nft& s) { s.revoke(tokenId, account); });
   }

   auto revokeAll(UserService::TokenId tokenId) const
   {
      return proxy.call<Nft>("revokeAll", [&](Nft& s) { s.revokeAll(tokenId); });
   }

   auto burn(UserService::TokenId tokenId, std::optional<std::string> memo = std::nullopt) const
   {
      return proxy.call<Nft>("burn", [&](Nft& s) { s.burn(tokenId, memo); });
   }

   auto isApproved(UserService::TokenId                   tokenId,
                   AccountId                              account,
                   std::optional<UserService::ApprovalId> approvalId = std::nullopt) const
   {
      return proxy.call<Nft>("isApproved", [&](Nft& s)
                             { return s.isApproved(tokenId, account, approvalId); });
   }

   auto getToken(UserService::TokenId tokenId) const
   {
      return proxy.call<Nft>("getToken", [&](Nft& s) { return s.getToken(tokenId); });
   }

   auto tokens(std::optional<std::uint64_t> fromIndex = std::nullopt,
               std::optional<std::uint64_t> limit     = std::nullopt) const
   {
      return proxy.call<Nft>("tokens", [&](Nft& s) { return s.tokens(fromIndex, limit); });
   }

   auto tokensForOwner(AccountId                    account,
                       std::optional<std::uint64_t> fromIndex = std::nullopt,
                       std::optional<std::uint64_t> limit     = std::nullopt) const
   {
      return proxy.call<Nft>("tokensForOwner", [&](Nft& s)
                             { return s.tokensForOwner(account, fromIndex, limit); });
   }

   auto supplyForOwner(AccountId account) const
   {
      return proxy.call<Nft>("supplyForOwner",
                             [&](Nft& s) { return s.supplyForOwner(account); });
   }

   auto totalSupply() const
   {
      return proxy.call<Nft>("totalSupply", [&](Nft& s) { return s.totalSupply(); });
   }

   auto metadata() const
   {
      return proxy.call<Nft>("metadata", [&](Nft& s) { return s.metadata(); });
   }
};
