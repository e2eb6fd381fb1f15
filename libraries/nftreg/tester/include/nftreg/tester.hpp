#pragma once
#include <catch2/catch.hpp>
#include <iostream>
#include <nftreg/Chain.hpp>
#include <nftreg/check.hpp>

namespace nftreg
{
   std::string prettyTrace(const ActionTrace& t);

   class TraceResult
   {
     public:
      TraceResult(ActionTrace&& t);
      bool succeeded();
      bool failed(std::string_view expected);

      /// Sum of the transfers released to `receiver`
      Amount refundedTo(const AccountId& receiver) const;

      const ActionTrace& trace() const { return _t; }

     protected:
      ActionTrace _t;
   };

   template <typename ReturnType>
   class Result : public TraceResult
   {
     public:
      Result(ActionResult<ReturnType>&& r)
          : TraceResult(std::move(r.trace)), _return(std::move(r.returnValue))
      {
      }

      ReturnType returnVal()
      {
         if (_t.error.has_value())
         {
            std::cout << prettyTrace(_t);
         }

         if (_return.has_value())
         {
            return (*_return);
         }
         else
         {
            check(false, "Action aborted, no return value");
            return ReturnType();  // Silence compiler warning
         }
      }

     private:
      std::optional<ReturnType> _return;
   };

   template <>
   class Result<void> : public TraceResult
   {
     public:
      Result(ActionResult<void>&& r) : TraceResult(std::move(r.trace)) {}
   };

   /// Call proxy for `Service`. Specialize it with one member function per
   /// action, each forwarding to [CallProxy::call].
   template <typename Service>
   struct ServiceUser;

   /// Registry running on an in-memory database, for tests
   class TestChain
   {
     public:
      explicit TestChain(const ChainConfig& config = {});
      TestChain(const TestChain&)            = delete;
      TestChain& operator=(const TestChain&) = delete;

      Chain&        chain() { return _chain; }
      std::uint64_t storageUsage() const { return _chain.database().storageUsage(); }

      /// Everything transferred to `receiver` by committed actions
      Amount totalRefunded(const AccountId& receiver) const
      {
         return _chain.totalTransferred(receiver);
      }

      /**
       *  Pushes one action and returns its trace and return value
       */
      struct CallProxy
      {
         TestChain& chain;
         AccountId  sender;
         Amount     deposit;

         template <typename Service, typename F>
         auto call(std::string_view method, F&& f) const
         {
            using result_type = std::invoke_result_t<F, Service&>;
            return Result<result_type>(
                chain._chain.pushAction<Service>(method, sender, deposit, std::forward<F>(f)));
         }
      };

      struct UserContext
      {
         TestChain& t;
         AccountId  id;
         Amount     deposit = 0;

         template <typename Other>
         auto to() const
         {
            return ServiceUser<Other>{CallProxy{t, id, deposit}};
         }

         /// Attach `deposit` to every action sent through the result
         auto with(const Amount& deposit) const
         {  //
            return UserContext{t, id, deposit};
         }

         operator AccountId() const { return id; }
      };

      auto from(const AccountId& id) { return UserContext{*this, id, 0}; }

     private:
      Chain _chain;
   };  // TestChain

}  // namespace nftreg

template <>
struct Catch::StringMaker<nftreg::AccountId>
{
   static std::string convert(const nftreg::AccountId& obj) { return obj.str(); }
};
