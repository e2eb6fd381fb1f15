#pragma once

#include <nftreg/KvStore.hpp>
#include <nftreg/from_bin.hpp>
#include <nftreg/to_bin.hpp>
#include <nftreg/to_key.hpp>

#include <optional>

namespace nftreg
{
   /// Key of tables which hold at most one record
   struct SingletonKey
   {
   };

   inline void to_key(const SingletonKey&, std::vector<char>&) {}

   using TableNum = std::uint8_t;

   /// Map from `Key` to `Value`, stored in a KvStore under the table prefix
   template <typename Key, typename Value>
   class Table
   {
     public:
      Table(KvStore& kv, TableNum table) : kv(&kv), table(table) {}

      std::optional<Value> get(const Key& key) const
      {
         auto bin = kv->get(keyOf(key));
         if (!bin)
            return std::nullopt;
         return from_bin<Value>(*bin);
      }

      bool contains(const Key& key) const { return kv->get(keyOf(key)).has_value(); }

      void put(const Key& key, const Value& value)
      {
         kv->put(keyOf(key), convert_to_bin(value));
      }

      void erase(const Key& key) { kv->remove(keyOf(key)); }

     private:
      std::vector<char> keyOf(const Key& key) const { return convert_to_key(table, key); }

      KvStore* kv;
      TableNum table;
   };

   /// Ordered sets of `Element`, one set per `Group`
   ///
   /// Elements are ordered by their key encoding. The element itself is
   /// stored as the value so that iteration never needs to decode keys.
   template <typename Group, typename Element>
   class Index
   {
     public:
      Index(KvStore& kv, TableNum table) : kv(&kv), table(table) {}

      bool contains(const Group& group, const Element& element) const
      {
         return kv->get(convert_to_key(table, group, element)).has_value();
      }

      void insert(const Group& group, const Element& element)
      {
         kv->put(convert_to_key(table, group, element), convert_to_bin(element));
      }

      void erase(const Group& group, const Element& element)
      {
         kv->remove(convert_to_key(table, group, element));
      }

      /// Calls `f(element)` for each element of the group in order until
      /// `f` returns false
      template <typename F>
      void forEach(const Group& group, F&& f) const
      {
         auto prefix = convert_to_key(table, group);
         auto key    = prefix;
         while (auto entry = kv->greaterEqual(key, prefix.size()))
         {
            if (!f(from_bin<Element>(entry->value)))
               break;
            key = std::move(entry->key);
            key.push_back(0);
         }
      }

     private:
      KvStore* kv;
      TableNum table;
   };
}  // namespace nftreg
