#pragma once

#include <nftreg/KvStore.hpp>

#include <map>
#include <optional>
#include <span>
#include <vector>

namespace nftreg
{
   struct DatabaseConfig
   {
      // Charged for every record on top of its key and value
      std::uint64_t recordOverhead = 40;
      // Charged once, before any record exists
      std::uint64_t baseUsage = 0;
   };

   /// KvStore held in memory
   ///
   /// Writes made while a session is active are undone if the session
   /// aborts. Sessions nest: committing an inner session folds its changes
   /// into the enclosing one.
   class MemoryDatabase : public KvStore
   {
     public:
      struct Session
      {
         MemoryDatabase* db = {};

         Session() = default;
         Session(MemoryDatabase* db) : db{db} {}
         Session(const Session&) = delete;
         Session(Session&& src)
         {
            db     = src.db;
            src.db = nullptr;
         }
         ~Session()
         {
            if (db)
               db->abort(*this);
         }

         Session& operator=(const Session&) = delete;

         Session& operator=(Session&& src)
         {
            if (db)
               db->abort(*this);
            db     = src.db;
            src.db = nullptr;
            return *this;
         }

         void commit()
         {
            if (db)
               db->commit(*this);
            db = nullptr;
         }
      };  // Session

      explicit MemoryDatabase(const DatabaseConfig& config = {});
      MemoryDatabase(const MemoryDatabase&) = delete;

      Session startWrite();
      void    commit(Session& session);
      void    abort(Session& session);

      std::optional<std::vector<char>> get(std::span<const char> key) const override;
      void put(std::span<const char> key, std::span<const char> value) override;
      void remove(std::span<const char> key) override;
      std::optional<KvEntry> greaterEqual(std::span<const char> key,
                                          std::size_t           matchKeySize) const override;
      std::uint64_t          storageUsage() const override;

      std::size_t           numRecords() const { return data.size(); }
      const DatabaseConfig& config() const { return cfg; }

     private:
      struct KeyLess
      {
         using is_transparent = void;
         bool operator()(std::span<const char> lhs, std::span<const char> rhs) const;
      };

      struct UndoEntry
      {
         std::vector<char>                key;
         std::optional<std::vector<char>> previous;
      };

      void saveUndo(std::span<const char> key);
      void restore(const UndoEntry& entry);

      DatabaseConfig                                          cfg;
      std::map<std::vector<char>, std::vector<char>, KeyLess> data;
      std::uint64_t                                           usage;
      std::vector<std::vector<UndoEntry>>                     undoStack;
   };
}  // namespace nftreg
