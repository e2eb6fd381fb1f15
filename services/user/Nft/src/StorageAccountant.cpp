#include <services/user/StorageAccountant.hpp>

#include <nftreg/check.hpp>
#include <services/user/nftErrors.hpp>

using namespace UserService;
using namespace UserService::Errors;
using nftreg::Amount;
using nftreg::check;

Amount StorageAccountant::priceOf(std::uint64_t bytes) const
{
   Amount size = bytes;
   check(!nftreg::productOverflows(size, cost), amountOverflow);
   return size * cost;
}

StorageSettlement StorageAccountant::measure(std::uint64_t preBytes,
                                             std::uint64_t postBytes,
                                             const Amount& attachedDeposit,
                                             Growth        growth) const
{
   StorageSettlement result;
   if (postBytes > preBytes && growth == Growth::absorbed)
   {
      result.refund = attachedDeposit;
   }
   else if (postBytes > preBytes)
   {
      result.required = priceOf(postBytes - preBytes);
      check(attachedDeposit >= result.required, insufficientDeposit,
            "must attach " + nftreg::to_string(result.required) + " to cover storage, attached " +
                nftreg::to_string(attachedDeposit));
      result.refund = attachedDeposit - result.required;
   }
   else
   {
      auto released = priceOf(preBytes - postBytes);
      check(!nftreg::sumOverflows(attachedDeposit, released), amountOverflow);
      result.refund = attachedDeposit + released;
   }
   return result;
}
