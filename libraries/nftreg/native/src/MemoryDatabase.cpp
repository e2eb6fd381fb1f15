#include <nftreg/MemoryDatabase.hpp>

#include <nftreg/check.hpp>

#include <algorithm>
#include <cstring>

namespace nftreg
{
   bool MemoryDatabase::KeyLess::operator()(std::span<const char> lhs,
                                            std::span<const char> rhs) const
   {
      auto n = std::min(lhs.size(), rhs.size());
      if (n)
      {
         // memcmp compares as unsigned char
         if (auto cmp = std::memcmp(lhs.data(), rhs.data(), n))
            return cmp < 0;
      }
      return lhs.size() < rhs.size();
   }

   MemoryDatabase::MemoryDatabase(const DatabaseConfig& config)
       : cfg(config), usage(config.baseUsage)
   {
   }

   MemoryDatabase::Session MemoryDatabase::startWrite()
   {
      undoStack.emplace_back();
      return Session{this};
   }

   void MemoryDatabase::commit(Session&)
   {
      check(!undoStack.empty(), "no active database session during commit");
      auto entries = std::move(undoStack.back());
      undoStack.pop_back();
      if (!undoStack.empty())
      {
         auto& outer = undoStack.back();
         outer.insert(outer.end(), std::make_move_iterator(entries.begin()),
                      std::make_move_iterator(entries.end()));
      }
   }

   void MemoryDatabase::abort(Session&)
   {
      if (undoStack.empty())
         return;
      auto& entries = undoStack.back();
      for (auto it = entries.rbegin(); it != entries.rend(); ++it)
         restore(*it);
      undoStack.pop_back();
   }

   void MemoryDatabase::saveUndo(std::span<const char> key)
   {
      if (undoStack.empty())
         return;
      UndoEntry entry{{key.begin(), key.end()}, std::nullopt};
      if (auto it = data.find(key); it != data.end())
         entry.previous = it->second;
      undoStack.back().push_back(std::move(entry));
   }

   // Writes directly, bypassing the undo log
   void MemoryDatabase::restore(const UndoEntry& entry)
   {
      auto it = data.find(std::span<const char>{entry.key});
      if (it != data.end())
      {
         usage -= it->first.size() + it->second.size() + cfg.recordOverhead;
         data.erase(it);
      }
      if (entry.previous)
      {
         usage += entry.key.size() + entry.previous->size() + cfg.recordOverhead;
         data.emplace(entry.key, *entry.previous);
      }
   }

   std::optional<std::vector<char>> MemoryDatabase::get(std::span<const char> key) const
   {
      auto it = data.find(key);
      if (it == data.end())
         return std::nullopt;
      return it->second;
   }

   void MemoryDatabase::put(std::span<const char> key, std::span<const char> value)
   {
      saveUndo(key);
      auto it = data.find(key);
      if (it != data.end())
      {
         usage -= it->second.size();
         it->second.assign(value.begin(), value.end());
         usage += value.size();
      }
      else
      {
         data.emplace(std::vector<char>(key.begin(), key.end()),
                      std::vector<char>(value.begin(), value.end()));
         usage += key.size() + value.size() + cfg.recordOverhead;
      }
   }

   void MemoryDatabase::remove(std::span<const char> key)
   {
      auto it = data.find(key);
      if (it == data.end())
         return;
      saveUndo(key);
      usage -= it->first.size() + it->second.size() + cfg.recordOverhead;
      data.erase(it);
   }

   std::optional<KvEntry> MemoryDatabase::greaterEqual(std::span<const char> key,
                                                       std::size_t           matchKeySize) const
   {
      auto it = data.lower_bound(key);
      if (it == data.end())
         return std::nullopt;
      auto& found = it->first;
      if (found.size() < matchKeySize || key.size() < matchKeySize ||
          (matchKeySize && std::memcmp(found.data(), key.data(), matchKeySize)))
         return std::nullopt;
      return KvEntry{found, it->second};
   }

   std::uint64_t MemoryDatabase::storageUsage() const
   {
      return usage;
   }
}  // namespace nftreg
