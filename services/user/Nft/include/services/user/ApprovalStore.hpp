#pragma once

#include <nftreg/KvStore.hpp>
#include <nftreg/Table.hpp>
#include <services/user/nftTypes.hpp>

#include <optional>

namespace UserService
{
   /// Accounts the owner of a token has approved to transfer it
   ///
   /// Each token has its own approval id counter. Ids start at 1 and are
   /// never reused for the token, even after revoking and approving the
   /// same account again, so an id issued before an owner change can never
   /// match an approval issued after it.
   class ApprovalStore
   {
     public:
      virtual ~ApprovalStore() = default;

      /// Issues the next approval id for the token and records it for
      /// `grantee`, replacing any approval `grantee` already held
      virtual ApprovalId approve(const TokenId& tokenId, const nftreg::AccountId& grantee) = 0;

      /// True if `account` is approved and, when `expected` is given, its
      /// approval id equals `expected`
      virtual bool isApproved(const TokenId&            tokenId,
                              const nftreg::AccountId&  account,
                              std::optional<ApprovalId> expected) const = 0;

      virtual std::optional<ApprovalId> approvalId(const TokenId&           tokenId,
                                                   const nftreg::AccountId& account) const = 0;

      virtual ApprovedAccounts approvals(const TokenId& tokenId) const = 0;

      /// Fails with approvalNotFound if `account` holds no approval
      virtual void revoke(const TokenId& tokenId, const nftreg::AccountId& account) = 0;

      virtual void revokeAll(const TokenId& tokenId) = 0;

      /// Drops the approvals and the counter of a token that no longer exists
      virtual void erase(const TokenId& tokenId) = 0;
   };

   class KvApprovalStore : public ApprovalStore
   {
     public:
      explicit KvApprovalStore(nftreg::KvStore& kv);

      ApprovalId approve(const TokenId& tokenId, const nftreg::AccountId& grantee) override;
      bool       isApproved(const TokenId&            tokenId,
                            const nftreg::AccountId&  account,
                            std::optional<ApprovalId> expected) const override;
      std::optional<ApprovalId> approvalId(const TokenId&           tokenId,
                                           const nftreg::AccountId& account) const override;
      ApprovedAccounts          approvals(const TokenId& tokenId) const override;
      void revoke(const TokenId& tokenId, const nftreg::AccountId& account) override;
      void revokeAll(const TokenId& tokenId) override;
      void erase(const TokenId& tokenId) override;

     private:
      nftreg::Table<TokenId, ApprovedAccounts> approvalsById;
      nftreg::Table<TokenId, ApprovalId>       nextApprovalId;
   };
}  // namespace UserService
