#pragma once

#include <consign/model/primitives.hpp>
#include <set>
#include <vector>

namespace consign::validation {

/// Read access to the base ledger, as far as validation needs it.
class chain_access {
 public:
  virtual ~chain_access() = default;

  /// True once `txid` is confirmed on the base ledger.
  virtual bool is_mined(const consign::model::txid_t& txid) const = 0;
};

/// Answers from a fixed set of transaction ids known to be confirmed.
class offline_chain_access final : public chain_access {
 public:
  offline_chain_access() = default;
  explicit offline_chain_access(std::vector<consign::model::txid_t> confirmed)
      : confirmed_{std::begin(confirmed), std::end(confirmed)} {}

  bool is_mined(const consign::model::txid_t& txid) const override {
    return confirmed_.contains(txid);
  }

 private:
  std::set<consign::model::txid_t> confirmed_;
};

}  // namespace consign::validation
