#include <services/user/Nft.hpp>

#include <nftreg/check.hpp>
#include <nftreg/log.hpp>
#include <services/user/nftEvents.hpp>

using namespace UserService;
using namespace Errors;
using nftreg::AccountId;
using nftreg::check;
using std::nullopt;
using std::optional;
using std::string;

namespace
{
   void checkAccount(const AccountId& account)
   {
      check(account.isValid(), invalidAccount, account.str());
   }
}  // namespace

NftStores NftStores::kv(nftreg::KvStore& kv)
{
   NftStores result;
   result.ownership   = std::make_unique<KvOwnershipStore>(kv);
   result.approvals   = std::make_unique<KvApprovalStore>(kv);
   result.enumeration = std::make_unique<KvEnumerationIndex>(kv);
   result.metadata    = std::make_unique<KvMetadataStore>(kv);
   return result;
}

Nft::Nft(nftreg::Host& host, std::string_view method)
    : Nft(host, method, NftStores::kv(host.kv()))
{
}

Nft::Nft(nftreg::Host& host, std::string_view method, NftStores stores)
    : host(&host), stores(std::move(stores))
{
   // init and initDefault
   if (!method.starts_with("init"))
   {
      auto initRecord = InitTable(host.kv(), NftTables::init).get(nftreg::SingletonKey{});
      check(initRecord.has_value(), uninitialized);
   }
}

void Nft::init(AccountId ownerId, ContractMetadata metadata)
{
   auto initTable = InitTable(host->kv(), NftTables::init);
   check(!initTable.contains(nftreg::SingletonKey{}), alreadyInit);
   checkAccount(ownerId);
   initTable.put(nftreg::SingletonKey{}, InitRecord{ownerId, std::move(metadata)});

   // The registry pays for its own configuration record
   if (auto deposit = host->attachedDeposit(); deposit > 0)
      host->scheduleTransfer(host->getSender(), deposit);

   auto& logger = nftreg::loggers::generic::get();
   NFTREG_LOG(logger, notice) << "registry initialized, owner " << ownerId.str();
}

void Nft::initDefault(AccountId ownerId)
{
   init(std::move(ownerId), defaultContractMetadata());
}

Token Nft::mint(TokenId tokenId, AccountId receiver, TokenMetadata metadata, optional<string> memo)
{
   auto init           = getInit();
   auto initialStorage = host->storageUsage();

   check(host->getSender() == init.ownerId, unauthorized);
   checkAccount(receiver);

   stores.ownership->insert(tokenId, receiver);
   stores.metadata->put(tokenId, metadata);
   stores.enumeration->onMint(tokenId, receiver);

   host->emitEvent(NftEvents::toLog(NftEvents::Mint{
       .ownerId  = receiver,
       .tokenIds = {tokenId},
       .memo     = std::move(memo),
   }));

   settleStorage(initialStorage);

   return Token{
       .tokenId            = std::move(tokenId),
       .ownerId            = std::move(receiver),
       .metadata           = std::move(metadata),
       .approvedAccountIds = ApprovedAccounts{},
   };
}

Token Nft::mintDefault(TokenId tokenId, AccountId receiver)
{
   return mint(std::move(tokenId), std::move(receiver), defaultTokenMetadata(), nullopt);
}

void Nft::transfer(AccountId            receiver,
                   TokenId              tokenId,
                   optional<AccountId>  expectedOwner,
                   optional<ApprovalId> approvalId,
                   optional<string>     memo)
{
   auto  initialStorage = host->storageUsage();
   auto  owner          = requireOwner(tokenId);
   auto& sender         = host->getSender();

   checkAccount(receiver);
   if (expectedOwner)
      check(*expectedOwner == owner, ownerMismatch, owner.str());

   optional<AccountId> authorizedId;
   if (sender != owner)
   {
      check(stores.approvals->isApproved(tokenId, sender, nullopt), unauthorized);
      check(stores.approvals->isApproved(tokenId, sender, approvalId), staleApproval);
      authorizedId = sender;
   }
   check(receiver != owner, selfTransfer);

   stores.ownership->setOwner(tokenId, receiver);
   stores.approvals->revokeAll(tokenId);
   stores.enumeration->onTransfer(tokenId, owner, receiver);

   host->emitEvent(NftEvents::toLog(NftEvents::Transfer{
       .oldOwnerId   = std::move(owner),
       .newOwnerId   = std::move(receiver),
       .tokenIds     = {std::move(tokenId)},
       .authorizedId = std::move(authorizedId),
       .memo         = std::move(memo),
   }));

   // Moving a token is free: the registry pays for a new owner's records
   settleStorage(initialStorage, Growth::absorbed);
}

ApprovalId Nft::approve(TokenId tokenId, AccountId account, optional<string> msg)
{
   auto initialStorage = host->storageUsage();
   auto owner          = requireOwner(tokenId);
   check(host->getSender() == owner, unauthorized);
   checkAccount(account);

   auto id = stores.approvals->approve(tokenId, account);

   auto& logger = nftreg::loggers::generic::get();
   NFTREG_LOG(logger, debug) << "approved " << account.str() << " for " << tokenId << " with id "
                             << id;
   if (msg)
      NFTREG_LOG(logger, info) << "approval message for " << account.str() << ": " << *msg;

   settleStorage(initialStorage);
   return id;
}

void Nft::revoke(TokenId tokenId, AccountId account)
{
   auto initialStorage = host->storageUsage();
   auto owner          = requireOwner(tokenId);
   check(host->getSender() == owner, unauthorized);

   stores.approvals->revoke(tokenId, account);
   settleStorage(initialStorage);
}

void Nft::revokeAll(TokenId tokenId)
{
   auto initialStorage = host->storageUsage();
   auto owner          = requireOwner(tokenId);
   check(host->getSender() == owner, unauthorized);

   stores.approvals->revokeAll(tokenId);
   settleStorage(initialStorage);
}

void Nft::burn(TokenId tokenId, optional<string> memo)
{
   auto initialStorage = host->storageUsage();
   auto owner          = requireOwner(tokenId);
   check(host->getSender() == owner, unauthorized);

   stores.ownership->remove(tokenId);
   stores.approvals->erase(tokenId);
   stores.metadata->erase(tokenId);
   stores.enumeration->onBurn(tokenId, owner);

   host->emitEvent(NftEvents::toLog(NftEvents::Burn{
       .ownerId      = std::move(owner),
       .tokenIds     = {std::move(tokenId)},
       .authorizedId = nullopt,
       .memo         = std::move(memo),
   }));

   settleStorage(initialStorage);
}

bool Nft::isApproved(TokenId tokenId, AccountId account, optional<ApprovalId> approvalId)
{
   requireOwner(tokenId);
   return stores.approvals->isApproved(tokenId, account, approvalId);
}

optional<Token> Nft::getToken(TokenId tokenId)
{
   auto owner = stores.ownership->get(tokenId);
   if (!owner)
      return nullopt;
   return makeToken(tokenId, std::move(*owner));
}

std::vector<Token> Nft::tokens(optional<std::uint64_t> fromIndex, optional<std::uint64_t> limit)
{
   std::vector<Token> result;
   for (auto& tokenId : stores.enumeration->tokens(fromIndex, limit))
      result.push_back(makeToken(tokenId, requireOwner(tokenId)));
   return result;
}

std::vector<Token> Nft::tokensForOwner(AccountId               account,
                                       optional<std::uint64_t> fromIndex,
                                       optional<std::uint64_t> limit)
{
   std::vector<Token> result;
   for (auto& tokenId : stores.enumeration->tokensForOwner(account, fromIndex, limit))
      result.push_back(makeToken(tokenId, account));
   return result;
}

std::uint64_t Nft::supplyForOwner(AccountId account)
{
   return stores.enumeration->supplyForOwner(account);
}

std::uint64_t Nft::totalSupply()
{
   return stores.enumeration->totalSupply();
}

ContractMetadata Nft::metadata()
{
   return getInit().metadata;
}

ContractMetadata Nft::defaultContractMetadata()
{
   return ContractMetadata{
       .name   = "Non-fungible tokens",
       .symbol = "NFT",
   };
}

TokenMetadata Nft::defaultTokenMetadata()
{
   return TokenMetadata{
       .title       = "Limited edition",
       .description = "Limited edition token",
       .copies      = 1,
   };
}

InitRecord Nft::getInit()
{
   auto record = InitTable(host->kv(), NftTables::init).get(nftreg::SingletonKey{});
   check(record.has_value(), uninitialized);
   return std::move(*record);
}

AccountId Nft::requireOwner(const TokenId& tokenId)
{
   auto owner = stores.ownership->get(tokenId);
   check(owner.has_value(), tokenNotFound, tokenId);
   return std::move(*owner);
}

Token Nft::makeToken(const TokenId& tokenId, AccountId owner)
{
   return Token{
       .tokenId            = tokenId,
       .ownerId            = std::move(owner),
       .metadata           = stores.metadata->get(tokenId),
       .approvedAccountIds = stores.approvals->approvals(tokenId),
   };
}

// Runs after the action's writes, on the storage they actually use
void Nft::settleStorage(std::uint64_t initialStorage, Growth growth)
{
   StorageAccountant accountant{host->storageByteCost()};
   auto              settlement =
       accountant.measure(initialStorage, host->storageUsage(), host->attachedDeposit(), growth);
   if (settlement.refund > 0)
      host->scheduleTransfer(host->getSender(), settlement.refund);
}
