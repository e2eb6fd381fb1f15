#pragma once

#include <nftreg/AccountId.hpp>
#include <nftreg/Amount.hpp>
#include <nftreg/KvStore.hpp>

#include <string>

namespace nftreg
{
   /// What a service sees of the runtime executing its current action
   ///
   /// The sender and the attached deposit are authenticated by the runtime
   /// and trusted as given. Transfers and events are only released if the
   /// action completes; an aborted action discards them.
   class Host
   {
     public:
      virtual ~Host() = default;

      virtual const AccountId& getSender() const       = 0;
      virtual Amount           attachedDeposit() const = 0;

      virtual KvStore&       kv()       = 0;
      virtual const KvStore& kv() const = 0;

      /// Price of one byte of storage
      virtual Amount storageByteCost() const = 0;

      /// Schedule `amount` to be sent to `receiver` after the action commits
      virtual void scheduleTransfer(const AccountId& receiver, const Amount& amount) = 0;

      /// Record an event log line for the current action
      virtual void emitEvent(std::string event) = 0;

      std::uint64_t storageUsage() const { return kv().storageUsage(); }
   };
}  // namespace nftreg
