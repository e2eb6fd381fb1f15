#include <services/user/OwnershipStore.hpp>

#include <nftreg/check.hpp>
#include <services/user/nftErrors.hpp>
#include <services/user/nftTables.hpp>

using namespace UserService;
using namespace UserService::Errors;
using nftreg::AccountId;
using nftreg::check;

KvOwnershipStore::KvOwnershipStore(nftreg::KvStore& kv)
    : owners(kv, NftTables::ownerById), burned(kv, NftTables::burnedIds)
{
}

void KvOwnershipStore::insert(const TokenId& tokenId, const AccountId& owner)
{
   check(!owners.contains(tokenId) && !wasBurned(tokenId), tokenAlreadyExists, tokenId);
   owners.put(tokenId, owner);
}

std::optional<AccountId> KvOwnershipStore::get(const TokenId& tokenId) const
{
   return owners.get(tokenId);
}

AccountId KvOwnershipStore::setOwner(const TokenId& tokenId, const AccountId& newOwner)
{
   auto previous = owners.get(tokenId);
   check(previous.has_value(), tokenNotFound, tokenId);
   owners.put(tokenId, newOwner);
   return std::move(*previous);
}

AccountId KvOwnershipStore::remove(const TokenId& tokenId)
{
   auto owner = owners.get(tokenId);
   check(owner.has_value(), tokenNotFound, tokenId);
   owners.erase(tokenId);
   burned.put(tokenId, true);
   return std::move(*owner);
}

bool KvOwnershipStore::wasBurned(const TokenId& tokenId) const
{
   return burned.contains(tokenId);
}
