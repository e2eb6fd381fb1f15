#include "replay.hpp"

#include "json.hpp"

#include <nftreg/check.hpp>
#include <services/user/Nft.hpp>

#include <optional>
#include <ostream>

using UserService::Nft;

namespace nftreg
{
   namespace
   {
      // One entry of the action script
      struct Step
      {
         AccountId               sender;
         Amount                  deposit;
         std::string             action;
         const rapidjson::Value* args;
      };

      const rapidjson::Value& emptyArgs()
      {
         static const rapidjson::Value empty{rapidjson::kObjectType};
         return empty;
      }

      Step parseStep(const rapidjson::Value& entry)
      {
         Step step{
             .sender  = json::getAccount(entry, "sender"),
             .deposit = json::getOptAmount(entry, "deposit").value_or(0),
             .action  = json::getString(entry, "action"),
             .args    = &emptyArgs(),
         };
         check(step.sender.isValid(), "invalid sender: " + step.sender.str());
         if (auto it = entry.FindMember("args"); it != entry.MemberEnd() && !it->value.IsNull())
            step.args = &it->value;
         return step;
      }

      template <typename F>
      void runStep(Chain& chain, const Step& step, json::Writer& out, F&& f)
      {
         auto result = chain.pushAction<Nft>(step.action, step.sender, step.deposit,
                                             [&](Nft& service) { return f(service, *step.args); });
         json::writeTrace(out, result.trace,
                          [&](json::Writer& w)
                          {
                             if constexpr (requires { result.returnValue; })
                             {
                                if (result.returnValue)
                                {
                                   w.Key("return");
                                   json::write(w, *result.returnValue);
                                }
                             }
                          });
      }

      // Action names follow the registry's external interface. Returns false
      // for an unknown action.
      bool dispatch(Chain& chain, const Step& step, json::Writer& out)
      {
         using namespace json;
         using Args = const rapidjson::Value&;

         const auto& a = step.action;
         if (a == "init")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    { s.init(getAccount(args, "owner_id"), getContractMetadata(args, "metadata")); });
         else if (a == "init_default")
            runStep(chain, step, out,
                    [](Nft& s, Args args) { s.initDefault(getAccount(args, "owner_id")); });
         else if (a == "mint")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    {
                       return s.mint(getString(args, "token_id"), getAccount(args, "receiver_id"),
                                     getTokenMetadata(args, "metadata"), getOptString(args, "memo"));
                    });
         else if (a == "mint_default")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    {
                       return s.mintDefault(getString(args, "token_id"),
                                            getAccount(args, "receiver_id"));
                    });
         else if (a == "transfer")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    {
                       s.transfer(getAccount(args, "receiver_id"), getString(args, "token_id"),
                                  getOptAccount(args, "expected_owner_id"),
                                  getOptU64(args, "approval_id"), getOptString(args, "memo"));
                    });
         else if (a == "approve")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    {
                       return s.approve(getString(args, "token_id"),
                                        getAccount(args, "account_id"), getOptString(args, "msg"));
                    });
         else if (a == "revoke")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    { s.revoke(getString(args, "token_id"), getAccount(args, "account_id")); });
         else if (a == "revoke_all")
            runStep(chain, step, out,
                    [](Nft& s, Args args) { s.revokeAll(getString(args, "token_id")); });
         else if (a == "burn")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    { s.burn(getString(args, "token_id"), getOptString(args, "memo")); });
         else if (a == "is_approved")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    {
                       return s.isApproved(getString(args, "token_id"),
                                           getAccount(args, "approved_account_id"),
                                           getOptU64(args, "approval_id"));
                    });
         else if (a == "get")
            runStep(chain, step, out,
                    [](Nft& s, Args args) { return s.getToken(getString(args, "token_id")); });
         else if (a == "tokens")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    { return s.tokens(getOptU64(args, "from_index"), getOptU64(args, "limit")); });
         else if (a == "tokens_for_owner")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    {
                       return s.tokensForOwner(getAccount(args, "account_id"),
                                               getOptU64(args, "from_index"),
                                               getOptU64(args, "limit"));
                    });
         else if (a == "supply_for_owner")
            runStep(chain, step, out,
                    [](Nft& s, Args args)
                    { return s.supplyForOwner(getAccount(args, "account_id")); });
         else if (a == "total_supply")
            runStep(chain, step, out, [](Nft& s, Args) { return s.totalSupply(); });
         else if (a == "metadata")
            runStep(chain, step, out, [](Nft& s, Args) { return s.metadata(); });
         else
            return false;
         return true;
      }

      // Trace of an entry that never reached the registry
      ActionTrace rejectedStep(const Chain& chain, const rapidjson::Value& entry, std::string error)
      {
         ActionTrace trace;
         if (entry.IsObject())
         {
            if (auto it = entry.FindMember("action"); it != entry.MemberEnd() && it->value.IsString())
               trace.method = it->value.GetString();
            if (auto it = entry.FindMember("sender"); it != entry.MemberEnd() && it->value.IsString())
               trace.sender = AccountId{it->value.GetString()};
         }
         trace.error         = std::move(error);
         trace.storageBefore = chain.database().storageUsage();
         trace.storageAfter  = trace.storageBefore;
         return trace;
      }
   }  // namespace

   std::string replayStep(Chain& chain, const rapidjson::Value& entry)
   {
      rapidjson::StringBuffer    buffer;
      json::Writer               out{buffer};
      std::optional<std::string> error;
      try
      {
         auto step = parseStep(entry);
         if (!dispatch(chain, step, out))
            error = "unknown action: " + step.action;
      }
      catch (const std::exception& e)
      {
         error = e.what();
      }

      if (error)
      {
         buffer.Clear();
         json::Writer rejected{buffer};
         json::writeTrace(rejected, rejectedStep(chain, entry, std::move(*error)),
                          [](json::Writer&) {});
      }
      return buffer.GetString();
   }

   void replay(Chain& chain, const rapidjson::Value& script, std::ostream& out)
   {
      check(script.IsArray(), "script must be an array of actions");
      for (const auto& entry : script.GetArray())
         out << replayStep(chain, entry) << "\n";
   }
}  // namespace nftreg
