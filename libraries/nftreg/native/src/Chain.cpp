#include <nftreg/Chain.hpp>

#include <nftreg/log.hpp>

namespace nftreg
{
   ExecutionContext::ExecutionContext(MemoryDatabase& db,
                                      const Amount&   storageByteCost,
                                      AccountId       sender,
                                      Amount          attachedDeposit)
       : db(db), byteCost(storageByteCost), sender(std::move(sender)), deposit(attachedDeposit)
   {
   }

   const AccountId& ExecutionContext::getSender() const
   {
      return sender;
   }

   Amount ExecutionContext::attachedDeposit() const
   {
      return deposit;
   }

   KvStore& ExecutionContext::kv()
   {
      return db;
   }

   const KvStore& ExecutionContext::kv() const
   {
      return db;
   }

   Amount ExecutionContext::storageByteCost() const
   {
      return byteCost;
   }

   void ExecutionContext::scheduleTransfer(const AccountId& receiver, const Amount& amount)
   {
      transfers.push_back(TransferRecord{receiver, amount});
   }

   void ExecutionContext::emitEvent(std::string event)
   {
      events.push_back(std::move(event));
   }

   Chain::Chain(const ChainConfig& config) : cfg(config), db(config.database) {}

   Amount Chain::totalTransferred(const AccountId& receiver) const
   {
      Amount total = 0;
      for (const auto& t : transfers)
         if (t.receiver == receiver)
            total += t.amount;
      return total;
   }

   void Chain::finishAction(const ActionTrace& trace)
   {
      auto& logger = loggers::generic::get();
      if (trace.error)
      {
         NFTREG_LOG(logger, info) << trace.method << " from " << trace.sender.str()
                                  << " aborted: " << *trace.error;
         return;
      }

      NFTREG_LOG(logger, debug) << trace.method << " from " << trace.sender.str()
                                << " attached " << to_string(trace.attachedDeposit)
                                << ", storage " << trace.storageBefore << " -> "
                                << trace.storageAfter;
      for (const auto& event : trace.events)
         NFTREG_LOG(logger, debug) << event;
      for (const auto& t : trace.transfers)
      {
         NFTREG_LOG(logger, debug) << "transfer " << to_string(t.amount) << " to "
                                   << t.receiver.str();
         transfers.push_back(t);
      }
   }
}  // namespace nftreg
