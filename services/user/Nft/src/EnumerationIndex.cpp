#include <services/user/EnumerationIndex.hpp>

#include <nftreg/check.hpp>
#include <services/user/nftErrors.hpp>
#include <services/user/nftTables.hpp>

#include <limits>

using namespace UserService;
using namespace UserService::Errors;
using nftreg::AccountId;
using nftreg::check;
using nftreg::SingletonKey;

namespace
{
   // Validates the paging arguments against a set of `size` elements and
   // collects the requested page
   template <typename Index, typename Group>
   std::vector<TokenId> page(const Index&                 index,
                             const Group&                 group,
                             std::uint64_t                size,
                             std::optional<std::uint64_t> fromIndex,
                             std::optional<std::uint64_t> limit)
   {
      auto start = fromIndex.value_or(0);
      auto count = limit.value_or(std::numeric_limits<std::uint64_t>::max());
      check(start <= size, outOfBounds);
      check(count != 0, zeroLimit);

      std::vector<TokenId> result;
      std::uint64_t        position = 0;
      index.forEach(group,
                    [&](TokenId tokenId)
                    {
                       if (position++ < start)
                          return true;
                       result.push_back(std::move(tokenId));
                       return result.size() < count;
                    });
      return result;
   }
}  // namespace

KvEnumerationIndex::KvEnumerationIndex(nftreg::KvStore& kv)
    : allTokens(kv, NftTables::allTokens),
      tokensPerOwner(kv, NftTables::tokensPerOwner),
      supply(kv, NftTables::totalSupply),
      supplyPerOwner(kv, NftTables::supplyPerOwner)
{
}

void KvEnumerationIndex::onMint(const TokenId& tokenId, const AccountId& owner)
{
   allTokens.insert(SingletonKey{}, tokenId);
   supply.put(SingletonKey{}, totalSupply() + 1);
   addToOwner(tokenId, owner);
}

void KvEnumerationIndex::onTransfer(const TokenId&   tokenId,
                                    const AccountId& oldOwner,
                                    const AccountId& newOwner)
{
   removeFromOwner(tokenId, oldOwner);
   addToOwner(tokenId, newOwner);
}

void KvEnumerationIndex::onBurn(const TokenId& tokenId, const AccountId& owner)
{
   removeFromOwner(tokenId, owner);
   allTokens.erase(SingletonKey{}, tokenId);
   auto remaining = totalSupply() - 1;
   if (remaining)
      supply.put(SingletonKey{}, remaining);
   else
      supply.erase(SingletonKey{});
}

std::vector<TokenId> KvEnumerationIndex::tokens(std::optional<std::uint64_t> fromIndex,
                                                std::optional<std::uint64_t> limit) const
{
   return page(allTokens, SingletonKey{}, totalSupply(), fromIndex, limit);
}

std::vector<TokenId> KvEnumerationIndex::tokensForOwner(const AccountId&             owner,
                                                        std::optional<std::uint64_t> fromIndex,
                                                        std::optional<std::uint64_t> limit) const
{
   auto size = supplyForOwner(owner);
   if (size == 0)
      return {};
   return page(tokensPerOwner, owner, size, fromIndex, limit);
}

std::uint64_t KvEnumerationIndex::totalSupply() const
{
   return supply.get(SingletonKey{}).value_or(0);
}

std::uint64_t KvEnumerationIndex::supplyForOwner(const AccountId& owner) const
{
   return supplyPerOwner.get(owner).value_or(0);
}

void KvEnumerationIndex::addToOwner(const TokenId& tokenId, const AccountId& owner)
{
   tokensPerOwner.insert(owner, tokenId);
   supplyPerOwner.put(owner, supplyForOwner(owner) + 1);
}

// An owner left with no tokens keeps no records
void KvEnumerationIndex::removeFromOwner(const TokenId& tokenId, const AccountId& owner)
{
   tokensPerOwner.erase(owner, tokenId);
   auto remaining = supplyForOwner(owner) - 1;
   if (remaining)
      supplyPerOwner.put(owner, remaining);
   else
      supplyPerOwner.erase(owner);
}
