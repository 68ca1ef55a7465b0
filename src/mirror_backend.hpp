#pragma once
/*
 * MirrorBackend
 *
 * Purpose: write-through fan-out; the primary is authoritative for loads,
 * every save goes to the primary and then to each replica.
 * Failure: a save fails if any target fails, but all targets are attempted.
 */
#include <memory>
#include <vector>
#include "backend.hpp"

class MirrorBackend : public INoteBackend {
public:
  explicit MirrorBackend(std::unique_ptr<INoteBackend> primary);
  void add_replica(std::unique_ptr<INoteBackend> replica);

  bool save_all(const std::vector<Note>& notes, std::string& msg) override;
  bool load_all(std::vector<Note>& out, std::string& msg) override;
  std::string describe() const override;

  size_t replica_count() const { return replicas_.size(); }

private:
  std::unique_ptr<INoteBackend> primary_;
  std::vector<std::unique_ptr<INoteBackend>> replicas_;
};
