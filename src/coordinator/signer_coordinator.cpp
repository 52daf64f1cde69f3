#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <launchpad/common/error.hpp>
#include <launchpad/coordinator/signer_coordinator.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/key/keys.hpp>
#include <set>

using namespace launchpad::schema;
using launchpad::execution::capability_t;

namespace launchpad::coordinator {

namespace {

inline constexpr auto kUnsignReason = "signature withdrawn";

bool contains(const std::vector<account_id_t>& signers,
              const account_id_t& signer) {
  return std::find(std::begin(signers), std::end(signers), signer) !=
         std::end(signers);
}

auto find_collected(std::vector<collected_signature_t>& collected,
                    const account_id_t& signer) {
  return std::find_if(std::begin(collected), std::end(collected),
                      [&](const auto& c) { return c.signer == signer; });
}

}  // namespace

signer_coordinator::signer_coordinator(
    const account_id_t& identity,
    launchpad::execution::authorization_policy& policy,
    launchpad::storage::rocksdb_storage_t& storage,
    launchpad::factory::creation_executor& executor,
    launchpad::attestation::attestation_notifier& notifier,
    const quorum_rule_t rule)
    : identity_{identity},
      policy_{policy},
      storage_{storage},
      executor_{executor},
      notifier_{notifier},
      rule_{rule} {
  load_persisted_state();
}

void signer_coordinator::open_signature_set(
    const account_id_t& caller,
    const request_id_t request_id,
    const account_id_t& requester,
    const std::vector<account_id_t>& signers,
    launchpad::execution::journal& tx) {
  policy_.require(caller, capability_t::open_signature_set);
  if (request_id == kSentinelRequestId) {
    launchpad::common::fail(transaction_error_code::invalid_transaction,
                            "request id 0 is reserved");
  }
  if (signers.size() < 2) {
    launchpad::common::fail(
        transaction_error_code::invalid_signer_count,
        fmt::format("at least 2 signers required, got {}", signers.size()));
  }
  if (std::set<account_id_t>{std::begin(signers), std::end(signers)}.size() !=
      signers.size()) {
    launchpad::common::fail(transaction_error_code::duplicate_signer,
                            "signer list contains duplicates");
  }

  auto target = std::shared_ptr<entry>{};
  {
    auto lock = std::unique_lock{table_mutex_};
    auto& existing = entries_[request_id];
    if (!existing) {
      existing = std::make_shared<entry>();
    }
    target = existing;
  }
  tx.hold(target->mutex);

  auto previous = target->set;
  tx.on_rollback([target, previous] { target->set = previous; });
  target->set = signature_set_t{.request_id = request_id,
                                .requester = requester,
                                .status = signature_set_status_t::open,
                                .quorum_rule = rule_,
                                .eligible_signers = signers,
                                .collected_signatures = {}};
  tx.put(key::make_signature_set_key(request_id), target->set);
}

void signer_coordinator::sign(const request_id_t request_id,
                              const account_id_t& signer,
                              launchpad::execution::journal& tx) {
  auto target = lock_open_entry(request_id, tx);
  auto& set = target->set;
  if (!contains(set.eligible_signers, signer)) {
    launchpad::common::fail(
        transaction_error_code::not_a_signer,
        fmt::format("{} is not a signer of request {}", to_hex(signer),
                    request_id));
  }
  if (find_collected(set.collected_signatures, signer) !=
      std::end(set.collected_signatures)) {
    launchpad::common::fail(
        transaction_error_code::already_signed,
        fmt::format("{} already signed request {}", to_hex(signer),
                    request_id));
  }

  auto previous = set;
  tx.on_rollback([target, previous] { target->set = previous; });

  auto required =
      required_approvals(set.quorum_rule, set.eligible_signers.size());
  if (set.collected_signatures.size() + 1 >= required) {
    execute(request_id, *target, tx);
    notifier_.record_signature(identity_, request_id, signer, tx);
    tx.emit("quorum_reached", {{"request_id", std::to_string(request_id)},
                               {"signer", to_hex(signer)},
                               {"trigger", "signature"}});
  } else {
    auto attestation_id =
        notifier_.record_signature(identity_, request_id, signer, tx);
    set.collected_signatures.push_back(collected_signature_t{
        .signer = signer, .attestation_id = attestation_id});
    tx.emit("request_signed",
            {{"request_id", std::to_string(request_id)},
             {"signer", to_hex(signer)},
             {"collected", std::to_string(set.collected_signatures.size())},
             {"required", std::to_string(required)}});
  }
  tx.put(key::make_signature_set_key(request_id), set);
}

void signer_coordinator::sign(const request_id_t request_id,
                              const account_id_t& signer) {
  auto tx = launchpad::execution::journal{storage_};
  sign(request_id, signer, tx);
  tx.commit();
}

void signer_coordinator::unsign(const request_id_t request_id,
                                const account_id_t& signer,
                                launchpad::execution::journal& tx) {
  auto target = lock_open_entry(request_id, tx);
  auto& set = target->set;
  if (!contains(set.eligible_signers, signer)) {
    launchpad::common::fail(
        transaction_error_code::not_a_signer,
        fmt::format("{} is not a signer of request {}", to_hex(signer),
                    request_id));
  }
  auto it = find_collected(set.collected_signatures, signer);
  if (it == std::end(set.collected_signatures)) {
    launchpad::common::fail(
        transaction_error_code::not_signed,
        fmt::format("{} has not signed request {}", to_hex(signer),
                    request_id));
  }

  auto previous = set;
  tx.on_rollback([target, previous] { target->set = previous; });

  auto attestation_id = it->attestation_id;
  set.collected_signatures.erase(it);
  notifier_.revoke_signature(identity_, attestation_id, kUnsignReason, tx);

  tx.put(key::make_signature_set_key(request_id), set);
  tx.emit("request_unsigned",
          {{"request_id", std::to_string(request_id)},
           {"signer", to_hex(signer)},
           {"collected", std::to_string(set.collected_signatures.size())}});
}

void signer_coordinator::unsign(const request_id_t request_id,
                                const account_id_t& signer) {
  auto tx = launchpad::execution::journal{storage_};
  unsign(request_id, signer, tx);
  tx.commit();
}

void signer_coordinator::retry_execution(const account_id_t& caller,
                                         const request_id_t request_id,
                                         launchpad::execution::journal& tx) {
  policy_.require(caller, capability_t::administer);
  auto target = lock_open_entry(request_id, tx);
  auto& set = target->set;

  auto required =
      required_approvals(set.quorum_rule, set.eligible_signers.size());
  if (set.collected_signatures.size() + 1 < required) {
    launchpad::common::fail(
        transaction_error_code::quorum_not_reached,
        fmt::format("request {} has {} of {} approvals needed for a retry",
                    request_id, set.collected_signatures.size(),
                    required - 1));
  }

  auto previous = set;
  tx.on_rollback([target, previous] { target->set = previous; });
  execute(request_id, *target, tx);

  tx.put(key::make_signature_set_key(request_id), set);
  tx.emit("quorum_reached", {{"request_id", std::to_string(request_id)},
                             {"signer", to_hex(caller)},
                             {"trigger", "retry"}});
}

void signer_coordinator::retry_execution(const account_id_t& caller,
                                         const request_id_t request_id) {
  auto tx = launchpad::execution::journal{storage_};
  retry_execution(caller, request_id, tx);
  tx.commit();
}

signature_set_t signer_coordinator::get_signature_set(
    const request_id_t request_id) const {
  auto set = try_get_signature_set(request_id);
  if (!set) {
    launchpad::common::fail(
        transaction_error_code::not_found,
        fmt::format("no signature set for request {}", request_id));
  }
  return *set;
}

std::optional<signature_set_t> signer_coordinator::try_get_signature_set(
    const request_id_t request_id) const {
  auto target = find_entry(request_id);
  if (!target) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{target->mutex};
  if (target->set.status == signature_set_status_t::vacant) {
    return std::nullopt;
  }
  return target->set;
}

std::shared_ptr<signer_coordinator::entry> signer_coordinator::find_entry(
    const request_id_t request_id) const {
  auto lock = std::shared_lock{table_mutex_};
  auto it = entries_.find(request_id);
  if (it == std::end(entries_)) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<signer_coordinator::entry> signer_coordinator::lock_open_entry(
    const request_id_t request_id,
    launchpad::execution::journal& tx) const {
  auto target = find_entry(request_id);
  if (!target) {
    launchpad::common::fail(
        transaction_error_code::not_found,
        fmt::format("no signature set for request {}", request_id));
  }
  tx.hold(target->mutex);
  switch (target->set.status) {
    case signature_set_status_t::vacant:
      launchpad::common::fail(
          transaction_error_code::not_found,
          fmt::format("no signature set for request {}", request_id));
    case signature_set_status_t::executed:
      launchpad::common::fail(
          transaction_error_code::transaction_already_executed,
          fmt::format("request {} was already executed", request_id));
    case signature_set_status_t::open:
      break;
  }
  return target;
}

void signer_coordinator::execute(const request_id_t request_id,
                                 entry& target,
                                 launchpad::execution::journal& tx) {
  executor_.execute_creation(identity_, request_id, tx);
  target.set.collected_signatures.clear();
  target.set.status = signature_set_status_t::executed;
}

void signer_coordinator::load_persisted_state() {
  auto lock = std::unique_lock{table_mutex_};
  auto encoder = launchpad::scale_encoder_t{};
  auto prefix = key::make_prefix(key::kSignatureSetPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto target = std::make_shared<entry>();
    target->set = encoder.decode<signature_set_t>(make_bytes_view(value));
    auto id = target->set.request_id;
    entries_.emplace(id, std::move(target));
  }
  spdlog::debug("Loaded {} signature set(s) under rule {}", entries_.size(),
                to_string(rule_));
}

}  // namespace launchpad::coordinator
