#pragma once

#include <nftreg/KvStore.hpp>
#include <nftreg/Table.hpp>
#include <services/user/nftTypes.hpp>

#include <optional>

namespace UserService
{
   /// Source of truth for who owns each token
   ///
   /// A token id is unique for the lifetime of the registry: once removed,
   /// it is remembered as burned and can not be inserted again.
   class OwnershipStore
   {
     public:
      virtual ~OwnershipStore() = default;

      /// Fails with tokenAlreadyExists if the id exists or was burned
      virtual void insert(const TokenId& tokenId, const nftreg::AccountId& owner) = 0;

      virtual std::optional<nftreg::AccountId> get(const TokenId& tokenId) const = 0;

      /// Returns the previous owner. Fails with tokenNotFound.
      virtual nftreg::AccountId setOwner(const TokenId&           tokenId,
                                         const nftreg::AccountId& newOwner) = 0;

      /// Returns the last owner. Fails with tokenNotFound.
      virtual nftreg::AccountId remove(const TokenId& tokenId) = 0;

      virtual bool wasBurned(const TokenId& tokenId) const = 0;
   };

   class KvOwnershipStore : public OwnershipStore
   {
     public:
      explicit KvOwnershipStore(nftreg::KvStore& kv);

      void insert(const TokenId& tokenId, const nftreg::AccountId& owner) override;
      std::optional<nftreg::AccountId> get(const TokenId& tokenId) const override;
      nftreg::AccountId setOwner(const TokenId&           tokenId,
                                 const nftreg::AccountId& newOwner) override;
      nftreg::AccountId remove(const TokenId& tokenId) override;
      bool              wasBurned(const TokenId& tokenId) const override;

     private:
      nftreg::Table<TokenId, nftreg::AccountId> owners;
      nftreg::Table<TokenId, bool>              burned;
   };
}  // namespace UserService
