#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <launchpad/attestation/attestation_registry.hpp>
#include <launchpad/common/error.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/key/keys.hpp>

using namespace launchpad::schema;

namespace launchpad::attestation {

attestation_registry::attestation_registry(
    launchpad::execution::authorization_policy& policy,
    launchpad::storage::rocksdb_storage_t& storage)
    : policy_{policy}, storage_{storage} {
  load_persisted_state();
}

attestation_id_t attestation_registry::record_signature(
    const account_id_t& caller,
    const request_id_t request_id,
    const account_id_t& signer,
    launchpad::execution::journal& tx) {
  policy_.require(caller,
                  launchpad::execution::capability_t::record_attestation);
  tx.hold(mutex_);

  auto id = next_id_++;
  auto record = attestation_record_t{.id = id,
                                     .request_id = request_id,
                                     .signer = signer,
                                     .status = attestation_status_t::active,
                                     .revoke_reason = {}};
  auto latest_key = latest_key_t{request_id, signer};
  auto previous_latest = std::optional<attestation_id_t>{};
  if (auto it = latest_.find(latest_key); it != std::end(latest_)) {
    previous_latest = it->second;
  }

  records_[id] = record;
  latest_[latest_key] = id;
  tx.on_rollback([this, id, latest_key, previous_latest] {
    records_.erase(id);
    // The registry lock is held until commit, so id is still the newest and
    // was never committed.
    next_id_ = id;
    if (previous_latest) {
      latest_[latest_key] = *previous_latest;
    } else {
      latest_.erase(latest_key);
    }
  });

  tx.put(key::make_attestation_key(id), record);
  tx.emit("attestation_recorded",
          {{"attestation_id", std::to_string(id)},
           {"request_id", std::to_string(request_id)},
           {"signer", to_hex(signer)}});
  return id;
}

void attestation_registry::revoke_signature(
    const account_id_t& caller,
    const attestation_id_t attestation_id,
    const std::string& reason,
    launchpad::execution::journal& tx) {
  policy_.require(caller,
                  launchpad::execution::capability_t::record_attestation);
  tx.hold(mutex_);

  auto it = records_.find(attestation_id);
  if (it == std::end(records_)) {
    launchpad::common::fail(
        transaction_error_code::not_found,
        fmt::format("attestation {} does not exist", attestation_id));
  }
  auto& record = it->second;
  if (record.status == attestation_status_t::revoked) {
    launchpad::common::fail(
        transaction_error_code::attestation_already_revoked,
        fmt::format("attestation {} is already revoked", attestation_id));
  }

  auto previous = record;
  record.status = attestation_status_t::revoked;
  record.revoke_reason = reason;
  tx.on_rollback([this, previous] { records_[previous.id] = previous; });

  tx.put(key::make_attestation_key(attestation_id), record);
  tx.emit("attestation_revoked",
          {{"attestation_id", std::to_string(attestation_id)},
           {"reason", reason}});
}

std::optional<attestation_record_t> attestation_registry::get(
    const attestation_id_t attestation_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = records_.find(attestation_id);
  if (it == std::end(records_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<attestation_record_t> attestation_registry::latest_for(
    const request_id_t request_id,
    const account_id_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = latest_.find(latest_key_t{request_id, signer});
  if (it == std::end(latest_)) {
    return std::nullopt;
  }
  return records_.at(it->second);
}

void attestation_registry::load_persisted_state() {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = launchpad::scale_encoder_t{};
  auto prefix = key::make_prefix(key::kAttestationPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto record = encoder.decode<attestation_record_t>(make_bytes_view(value));
    next_id_ = std::max(next_id_, record.id + 1);
    // Rows iterate in ascending id order, so the last write per key wins.
    latest_[latest_key_t{record.request_id, record.signer}] = record.id;
    records_.emplace(record.id, std::move(record));
  }
  spdlog::debug("Loaded {} attestation(s); next id {}", records_.size(),
                next_id_);
}

}  // namespace launchpad::attestation
