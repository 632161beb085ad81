#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "lease_backend.hpp"
#include "leaser.hpp"

namespace walship::lease {

struct CoordinatedLeaserOptions {
  std::string    key        = "walship/primary";
  util::Duration ttl        = std::chrono::seconds(10);
  util::Duration lock_delay = std::chrono::seconds(5);
  Node           self;
};

/*
  Leaser over a shared LeaseBackend (in-process table or PostgreSQL).

  All contention and lock-delay decisions are made by the backend; this
  class only remembers which lease it holds.
*/
class CoordinatedLeaser final : public Leaser {
 public:
  CoordinatedLeaser(std::shared_ptr<LeaseBackend> backend, CoordinatedLeaserOptions options);

  void Open() override;
  void Close() override;

  const Node& Self() const override {
    return options_.self;
  }

  bool IsPrimary() const override;
  Node Primary() override;

  Lease Acquire(const Node& candidate) override;
  Lease Renew(const Lease& lease) override;
  void  Release(const Lease& lease) override;

  const CoordinatedLeaserOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<LeaseBackend> backend_;
  CoordinatedLeaserOptions      options_;

  mutable std::mutex   mutex_;
  std::optional<Lease> held_;
};

} // namespace walship::lease
