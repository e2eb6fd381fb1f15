#include <services/user/ApprovalStore.hpp>

#include <nftreg/check.hpp>
#include <services/user/nftErrors.hpp>
#include <services/user/nftTables.hpp>

#include <limits>

using namespace UserService;
using namespace UserService::Errors;
using nftreg::AccountId;
using nftreg::check;

namespace
{
   constexpr ApprovalId firstApprovalId = 1;
}

KvApprovalStore::KvApprovalStore(nftreg::KvStore& kv)
    : approvalsById(kv, NftTables::approvalsById), nextApprovalId(kv, NftTables::nextApprovalId)
{
}

ApprovalId KvApprovalStore::approve(const TokenId& tokenId, const AccountId& grantee)
{
   auto id = nextApprovalId.get(tokenId).value_or(firstApprovalId);
   check(id != std::numeric_limits<ApprovalId>::max(), approvalIdOverflow, tokenId);

   auto accounts     = approvals(tokenId);
   accounts[grantee] = id;
   approvalsById.put(tokenId, accounts);
   nextApprovalId.put(tokenId, id + 1);
   return id;
}

bool KvApprovalStore::isApproved(const TokenId&            tokenId,
                                 const AccountId&          account,
                                 std::optional<ApprovalId> expected) const
{
   auto actual = approvalId(tokenId, account);
   if (!actual)
      return false;
   if (expected)
      return *actual == *expected;
   return true;
}

std::optional<ApprovalId> KvApprovalStore::approvalId(const TokenId&   tokenId,
                                                      const AccountId& account) const
{
   auto accounts = approvals(tokenId);
   if (auto it = accounts.find(account); it != accounts.end())
      return it->second;
   return std::nullopt;
}

ApprovedAccounts KvApprovalStore::approvals(const TokenId& tokenId) const
{
   return approvalsById.get(tokenId).value_or(ApprovedAccounts{});
}

void KvApprovalStore::revoke(const TokenId& tokenId, const AccountId& account)
{
   auto accounts = approvals(tokenId);
   check(accounts.erase(account) == 1, approvalNotFound, account.str());

   // An empty set is not stored
   if (accounts.empty())
      approvalsById.erase(tokenId);
   else
      approvalsById.put(tokenId, accounts);
}

void KvApprovalStore::revokeAll(const TokenId& tokenId)
{
   approvalsById.erase(tokenId);
}

void KvApprovalStore::erase(const TokenId& tokenId)
{
   approvalsById.erase(tokenId);
   nextApprovalId.erase(tokenId);
}
