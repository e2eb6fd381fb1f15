#pragma once

#include <nftreg/Table.hpp>
#include <services/user/nftTypes.hpp>

namespace UserService
{
   // Key prefixes of the registry's tables
   namespace NftTables
   {
      constexpr nftreg::TableNum init             = 0;
      constexpr nftreg::TableNum ownerById        = 1;
      constexpr nftreg::TableNum burnedIds        = 2;
      constexpr nftreg::TableNum tokenMetadata    = 3;
      constexpr nftreg::TableNum approvalsById    = 4;
      constexpr nftreg::TableNum nextApprovalId   = 5;
      constexpr nftreg::TableNum allTokens        = 6;
      constexpr nftreg::TableNum tokensPerOwner   = 7;
      constexpr nftreg::TableNum totalSupply      = 8;
      constexpr nftreg::TableNum supplyPerOwner   = 9;
   }  // namespace NftTables

   struct InitRecord
   {
      nftreg::AccountId ownerId;
      ContractMetadata  metadata;
   };
   NFTREG_REFLECT(InitRecord, (ownerId)(metadata))
   using InitTable = nftreg::Table<nftreg::SingletonKey, InitRecord>;
}  // namespace UserService
