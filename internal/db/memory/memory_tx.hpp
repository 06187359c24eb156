#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace handoff::db::memory {

/*
  Transaction = snapshot + written-row versions + queue claims
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  // records the base version of a row before its first write
  void Touch(Table table, const std::string& key);

  // rebases a row on a version read from committed state
  void Rebase(Table table, const std::string& key, uint64_t version);

  void AddClaim(const std::string& transfer_id) {
    claimed_.insert(transfer_id);
  }

  bool Wrote(Table table, const std::string& key) const {
    return base_versions_.contains({table, key});
  }

 private:
  using RowKey = std::pair<Table, std::string>;

  uint64_t WorkingVersion(Table table, const std::string& key) const;
  void     CheckVersions() const;
  void     CheckClaims() const;
  void     MergeClaims();
  void     CheckActiveTransfers() const;
  void     Apply();
  void     ReleaseClaims();

  MemoryRepository&          repo_;
  MemoryRepository::State    working_;
  std::map<RowKey, uint64_t> base_versions_; // 0 = row did not exist
  std::set<std::string>      claimed_;
  bool                       committed_   = false;
  bool                       rolled_back_ = false;
};

} // namespace handoff::db::memory
