#include <boost/program_options.hpp>
#include <launchpad/blake3/hash.hpp>
#include <launchpad/common/critical.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

std::string encode_base64(const launchpad::schema::bytes_t& input) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((input.size() + 2) / 3) * 4);

  auto i = size_t{0};
  while (i + 3 <= input.size()) {
    auto value = (static_cast<uint32_t>(input[i]) << 16u) |
                 (static_cast<uint32_t>(input[i + 1]) << 8u) |
                 static_cast<uint32_t>(input[i + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    i += 3;
  }
  if (i < input.size()) {
    auto value = static_cast<uint32_t>(input[i]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((i + 1) < input.size()) {
      value |= static_cast<uint32_t>(input[i + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }
  return out;
}

/// Accepts 64 hex characters, or any other text which is hashed with blake3
/// so that test identities can be named ("alice").
launchpad::schema::hash32_t parse_identity(const std::string& value) {
  if (auto hash = launchpad::schema::try_make_hash32(value)) {
    return *hash;
  }
  return launchpad::blake3::hash(std::string_view{value});
}

launchpad::schema::hash32_t get_identity(const po::variables_map& vm,
                                         const std::string& name) {
  if (!vm.contains(name)) {
    launchpad::common::critical("missing required argument --{}", name);
  }
  return parse_identity(vm[name].as<std::string>());
}

launchpad::schema::hash32_t get_hash32(const po::variables_map& vm,
                                       const std::string& name) {
  if (!vm.contains(name)) {
    launchpad::common::critical("missing required argument --{}", name);
  }
  return launchpad::schema::make_hash32(vm[name].as<std::string>());
}

launchpad::schema::amount_t get_amount(const po::variables_map& vm,
                                       const std::string& name) {
  auto amount =
      launchpad::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    launchpad::common::critical("--{} must be a 256-bit decimal", name);
  }
  return *amount;
}

uint64_t get_request_id(const po::variables_map& vm) {
  if (!vm.contains("request-id")) {
    launchpad::common::critical("missing required argument --request-id");
  }
  return vm["request-id"].as<uint64_t>();
}

launchpad::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "submit") {
    auto signers = std::vector<launchpad::schema::account_id_t>{};
    if (vm.contains("signer")) {
      for (const auto& signer : vm["signer"].as<std::vector<std::string>>()) {
        signers.push_back(parse_identity(signer));
      }
    }
    return launchpad::schema::submit_creation_request_t{
        .signers = std::move(signers),
        .token = launchpad::schema::token_spec_t{
            .name = vm["name"].as<std::string>(),
            .symbol = vm["symbol"].as<std::string>(),
            .total_supply = get_amount(vm, "total-supply"),
            .max_supply = get_amount(vm, "max-supply"),
            .mintable = vm["mintable"].as<bool>(),
            .burnable = vm["burnable"].as<bool>(),
            .supply_capped = vm["supply-capped"].as<bool>()}};
  }
  if (payload == "sign") {
    return launchpad::schema::sign_request_t{.request_id = get_request_id(vm)};
  }
  if (payload == "unsign") {
    return launchpad::schema::unsign_request_t{
        .request_id = get_request_id(vm)};
  }
  if (payload == "retry") {
    return launchpad::schema::retry_execution_t{
        .request_id = get_request_id(vm)};
  }
  if (payload == "add-liquidity") {
    return launchpad::schema::add_liquidity_t{
        .pool_id = get_hash32(vm, "pool-id"),
        .amount = get_amount(vm, "amount"),
        .timestamp = vm["timestamp"].as<uint64_t>()};
  }
  launchpad::common::critical("unsupported payload '{}'", payload);
}

launchpad::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = launchpad::scale_encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/request" || path == "/signatures") {
    return encoder.encode(get_request_id(vm));
  }
  if (path == "/attestation") {
    if (!vm.contains("attestation-id")) {
      launchpad::common::critical("missing required argument --attestation-id");
    }
    return encoder.encode(vm["attestation-id"].as<uint64_t>());
  }
  if (path == "/token") {
    auto address = get_hash32(vm, "token");
    return launchpad::schema::bytes_t{std::begin(address), std::end(address)};
  }
  if (path == "/pool") {
    auto pool_id = get_hash32(vm, "pool-id");
    return launchpad::schema::bytes_t{std::begin(pool_id), std::end(pool_id)};
  }
  if (path == "/vesting") {
    auto pool_id = get_hash32(vm, "pool-id");
    auto beneficiary = get_identity(vm, "beneficiary");
    auto key = launchpad::schema::bytes_t{std::begin(pool_id), std::end(pool_id)};
    key.insert(std::end(key), std::begin(beneficiary), std::end(beneficiary));
    return key;
  }
  if (path == "/engine/info") {
    return {};
  }
  launchpad::common::critical("unsupported query path '{}'", path);
}

std::string format_output(const po::variables_map& vm,
                          const launchpad::schema::bytes_t& bytes) {
  if (vm.contains("base64")) {
    return encode_base64(bytes);
  }
  return launchpad::schema::to_hex(launchpad::schema::make_bytes_view(bytes));
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction --payload <kind> [options]\n"
            << "  transaction_builder query-key --path <path> [options]\n"
            << "  transaction_builder identity --seed <text>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|identity")(
      "payload", po::value<std::string>(),
      "submit|sign|unsign|retry|add-liquidity")(
      "path", po::value<std::string>(), "query path")(
      "caller", po::value<std::string>(), "caller identity, hex or name")(
      "signer", po::value<std::vector<std::string>>()->multitoken(),
      "signer identities, hex or names")(
      "name", po::value<std::string>()->default_value(""), "token name")(
      "symbol", po::value<std::string>()->default_value(""), "token symbol")(
      "total-supply", po::value<std::string>()->default_value("0"),
      "initial supply")(
      "max-supply", po::value<std::string>()->default_value("0"),
      "supply cap")("mintable", po::value<bool>()->default_value(false),
                    "token is mintable")(
      "burnable", po::value<bool>()->default_value(false), "token is burnable")(
      "supply-capped", po::value<bool>()->default_value(false),
      "max supply is enforced")(
      "request-id", po::value<uint64_t>(), "creation request id")(
      "attestation-id", po::value<uint64_t>(), "attestation id")(
      "token", po::value<std::string>(), "token address hash32 hex")(
      "pool-id", po::value<std::string>(), "pool id hash32 hex")(
      "beneficiary", po::value<std::string>(), "vesting beneficiary")(
      "amount", po::value<std::string>()->default_value("0"),
      "liquidity amount")(
      "timestamp", po::value<uint64_t>()->default_value(0),
      "liquidity timestamp ms")(
      "seed", po::value<std::string>(), "identity seed text")(
      "base64", "print base64 instead of hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      launchpad::common::critical("transaction mode requires --payload");
    }
    auto transaction =
        launchpad::schema::transaction_t{.version = 1,
                                         .caller = get_identity(vm, "caller"),
                                         .payload = build_payload(vm)};
    auto encoded = launchpad::scale_encoder_t{}.encode(transaction);
    std::cout << format_output(vm, encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      launchpad::common::critical("query-key mode requires --path");
    }
    std::cout << format_output(vm, build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "identity") {
    auto identity = get_identity(vm, "seed");
    std::cout << launchpad::schema::to_hex(identity) << '\n';
    return 0;
  }

  launchpad::common::critical("command must be transaction|query-key|identity");
}
