#include <nftreg/tester.hpp>

#include <nftreg/log.hpp>

#include <sstream>

namespace
{
   // Tests only report warnings and errors
   void quietLogging()
   {
      static bool configured = false;
      if (!configured)
      {
         nftreg::loggers::configure(nftreg::loggers::level::warning);
         configured = true;
      }
   }
}  // namespace

std::string nftreg::prettyTrace(const ActionTrace& t)
{
   std::ostringstream out;
   out << "action:  " << t.method << "\n";
   out << "sender:  " << t.sender.str() << "\n";
   out << "deposit: " << to_string(t.attachedDeposit) << "\n";
   out << "storage: " << t.storageBefore << " -> " << t.storageAfter << "\n";
   for (const auto& event : t.events)
      out << "event:   " << event << "\n";
   for (const auto& transfer : t.transfers)
      out << "refund:  " << to_string(transfer.amount) << " to " << transfer.receiver.str()
          << "\n";
   if (t.error)
      out << "error:   " << *t.error << "\n";
   return out.str();
}

nftreg::TraceResult::TraceResult(ActionTrace&& t) : _t(std::move(t)) {}

bool nftreg::TraceResult::succeeded()
{
   bool hasErrObj = (_t.error != std::nullopt);
   bool failed    = hasErrObj && (*_t.error) != "";
   if (failed)
   {
      UNSCOPED_INFO("action failed: " << *_t.error << "\n");
   }

   return !failed;
}

bool nftreg::TraceResult::failed(std::string_view expected)
{
   bool failed = (_t.error != std::nullopt);
   if (!failed)
   {
      UNSCOPED_INFO("action succeeded, but was expected to fail");
      return false;
   }

   if (_t.error->find(expected) != std::string::npos)
   {
      return true;
   }
   else
   {
      UNSCOPED_INFO("action was expected to fail with: \"" << expected
                                                           << "\", but it failed with: \""
                                                           << *_t.error << "\"\n");
   }

   return false;
}

nftreg::Amount nftreg::TraceResult::refundedTo(const AccountId& receiver) const
{
   Amount total = 0;
   for (const auto& transfer : _t.transfers)
      if (transfer.receiver == receiver)
         total += transfer.amount;
   return total;
}

nftreg::TestChain::TestChain(const ChainConfig& config) : _chain(config)
{
   quietLogging();
}
