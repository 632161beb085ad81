#pragma once

#include <atomic>

#include "leaser.hpp"

namespace walship::lease {

/*
  One permanent primary, fixed by configuration.

  Acquire succeeds only on the configured primary and never touches a
  backend. Leases are unbounded and lock-delay does not apply.
*/
class StaticLeaser final : public Leaser {
 public:
  StaticLeaser(bool is_primary, Node self, Node primary);

  void Open() override;
  void Close() override;

  const Node& Self() const override {
    return self_;
  }

  bool IsPrimary() const override;
  Node Primary() override;

  Lease Acquire(const Node& candidate) override;
  Lease Renew(const Lease& lease) override;
  void  Release(const Lease& lease) override;

 private:
  const bool        is_primary_;
  const Node        self_;
  const Node        primary_;
  std::atomic<bool> held_{false};
};

} // namespace walship::lease
