#pragma once

#include <nftreg/Amount.hpp>

#include <cstdint>

namespace UserService
{
   struct StorageSettlement
   {
      // Payment kept to cover storage added by the action
      nftreg::Amount required = 0;
      // Returned to the caller: unused deposit plus the price of freed storage
      nftreg::Amount refund = 0;
   };

   /// Who pays for storage an action adds
   enum class Growth
   {
      // The caller, out of the attached deposit
      charged,
      // The registry; the caller is never asked for a deposit
      absorbed,
   };

   /// Prices the change in storage caused by an action
   ///
   /// Must be given the usage measured after the action's writes. With
   /// charged growth, fails with insufficientDeposit if the attached deposit
   /// doesn't cover added storage. Fails with amountOverflow if any amount
   /// exceeds 128 bits.
   class StorageAccountant
   {
     public:
      explicit StorageAccountant(const nftreg::Amount& byteCost) : cost(byteCost) {}

      StorageSettlement measure(std::uint64_t         preBytes,
                                std::uint64_t         postBytes,
                                const nftreg::Amount& attachedDeposit,
                                Growth                growth = Growth::charged) const;

      nftreg::Amount priceOf(std::uint64_t bytes) const;

     private:
      nftreg::Amount cost;
   };
}  // namespace UserService
