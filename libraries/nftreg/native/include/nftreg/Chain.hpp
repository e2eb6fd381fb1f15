#pragma once

#include <nftreg/Host.hpp>
#include <nftreg/MemoryDatabase.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace nftreg
{
   // 10^19 per byte, which prices 100 KB at one whole unit of 10^24
   inline const Amount defaultStorageByteCost = Amount{10'000'000'000'000'000'000ull};

   struct ChainConfig
   {
      DatabaseConfig database;
      Amount         storageByteCost = defaultStorageByteCost;
   };

   struct TransferRecord
   {
      AccountId receiver;
      Amount    amount;

      friend bool operator==(const TransferRecord&, const TransferRecord&) = default;
   };

   struct ActionTrace
   {
      std::string                method;
      AccountId                  sender;
      Amount                     attachedDeposit;
      std::optional<std::string> error;
      std::vector<TransferRecord> transfers;
      std::vector<std::string>    events;
      std::uint64_t               storageBefore = 0;
      std::uint64_t               storageAfter  = 0;
   };

   template <typename T>
   struct ActionResult
   {
      ActionTrace      trace;
      std::optional<T> returnValue;
   };

   template <>
   struct ActionResult<void>
   {
      ActionTrace trace;
   };

   /// Host for a single action
   class ExecutionContext : public Host
   {
     public:
      ExecutionContext(MemoryDatabase& db,
                       const Amount&   storageByteCost,
                       AccountId       sender,
                       Amount          attachedDeposit);

      const AccountId& getSender() const override;
      Amount           attachedDeposit() const override;
      KvStore&         kv() override;
      const KvStore&   kv() const override;
      Amount           storageByteCost() const override;
      void scheduleTransfer(const AccountId& receiver, const Amount& amount) override;
      void emitEvent(std::string event) override;

      std::vector<TransferRecord> takeTransfers() { return std::move(transfers); }
      std::vector<std::string>    takeEvents() { return std::move(events); }

     private:
      MemoryDatabase&             db;
      Amount                      byteCost;
      AccountId                   sender;
      Amount                      deposit;
      std::vector<TransferRecord> transfers;
      std::vector<std::string>    events;
   };

   /// Runs actions against an in-memory database, one at a time
   ///
   /// Each action runs in its own database session. If the action throws,
   /// the session is reverted and the action's transfers and events are
   /// dropped; the error message is recorded in the trace.
   class Chain
   {
     public:
      explicit Chain(const ChainConfig& config = {});
      Chain(const Chain&) = delete;

      template <typename Service, typename F>
      auto pushAction(std::string_view method,
                      const AccountId& sender,
                      const Amount&    deposit,
                      F&&              f) -> ActionResult<std::invoke_result_t<F, Service&>>
      {
         using R = std::invoke_result_t<F, Service&>;
         ActionResult<R> result;
         auto&           trace = result.trace;
         trace.method          = method;
         trace.sender          = sender;
         trace.attachedDeposit = deposit;
         trace.storageBefore   = db.storageUsage();
         {
            auto             session = db.startWrite();
            ExecutionContext context{db, cfg.storageByteCost, sender, deposit};
            try
            {
               Service service{context, method};
               if constexpr (std::is_void_v<R>)
                  f(service);
               else
                  result.returnValue.emplace(f(service));
               session.commit();
               trace.transfers = context.takeTransfers();
               trace.events    = context.takeEvents();
            }
            catch (const std::exception& e)
            {
               trace.error = e.what();
               if constexpr (!std::is_void_v<R>)
                  result.returnValue.reset();
            }
         }
         trace.storageAfter = db.storageUsage();
         finishAction(trace);
         return result;
      }

      MemoryDatabase&       database() { return db; }
      const MemoryDatabase& database() const { return db; }
      const ChainConfig&    config() const { return cfg; }

      /// Every transfer released by a committed action, in order
      const std::vector<TransferRecord>& transferLog() const { return transfers; }
      Amount                             totalTransferred(const AccountId& receiver) const;

     private:
      void finishAction(const ActionTrace& trace);

      ChainConfig                 cfg;
      MemoryDatabase              db;
      std::vector<TransferRecord> transfers;
   };
}  // namespace nftreg
