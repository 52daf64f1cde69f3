#include <gtest/gtest.h>
#include <launchpad/blake3/hash.hpp>
#include <launchpad/schema/encoding/scale/encoder.hpp>
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef LAUNCHPAD_TRANSACTION_BUILDER_PATH
#define LAUNCHPAD_TRANSACTION_BUILDER_PATH ""
#endif

using namespace launchpad::schema;

namespace {

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{LAUNCHPAD_TRANSACTION_BUILDER_PATH};
}

}  // namespace

TEST(transaction_builder, sign_transaction_decodes_to_expected_payload) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto hex = run_builder(builder,
                         "transaction --payload sign --caller alice "
                         "--request-id 7");
  auto bytes = try_from_hex(hex);
  ASSERT_TRUE(bytes.has_value()) << hex;

  auto codec = launchpad::scale_encoder_t{};
  auto tx = codec.try_decode<transaction_t>(make_bytes_view(*bytes));
  ASSERT_TRUE(tx.has_value());
  EXPECT_EQ(tx->version, 1u);
  EXPECT_EQ(tx->caller, launchpad::blake3::hash(std::string_view{"alice"}));
  ASSERT_TRUE(std::holds_alternative<sign_request_t>(tx->payload));
  EXPECT_EQ(std::get<sign_request_t>(tx->payload).request_id, 7u);
}

TEST(transaction_builder, submit_transaction_carries_signers_and_spec) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto hex = run_builder(
      builder,
      "transaction --payload submit --caller requester --signer alice bob "
      "carol --name 'Doge Two' --symbol DOGE2 --total-supply 1000 "
      "--max-supply 5000 --supply-capped true");
  auto bytes = try_from_hex(hex);
  ASSERT_TRUE(bytes.has_value()) << hex;

  auto codec = launchpad::scale_encoder_t{};
  auto tx = codec.decode<transaction_t>(make_bytes_view(*bytes));
  ASSERT_TRUE(std::holds_alternative<submit_creation_request_t>(tx.payload));
  const auto& payload = std::get<submit_creation_request_t>(tx.payload);
  ASSERT_EQ(payload.signers.size(), 3u);
  EXPECT_EQ(payload.signers[2],
            launchpad::blake3::hash(std::string_view{"carol"}));
  EXPECT_EQ(payload.token.name, "Doge Two");
  EXPECT_EQ(payload.token.symbol, "DOGE2");
  EXPECT_EQ(payload.token.total_supply, 1000);
  EXPECT_EQ(payload.token.max_supply, 5000);
  EXPECT_TRUE(payload.token.supply_capped);
}

TEST(transaction_builder, query_keys_match_engine_routes) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction_builder binary not available: " << builder;
  }

  auto codec = launchpad::scale_encoder_t{};
  auto request_key =
      run_builder(builder, "query-key --path /request --request-id 3");
  EXPECT_EQ(request_key, to_hex(make_bytes_view(codec.encode(uint64_t{3}))));

  constexpr auto kPoolId =
      "eeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeeee";
  auto pool_key = run_builder(builder, "query-key --path /pool --pool-id " +
                                           std::string{kPoolId});
  EXPECT_EQ(pool_key, kPoolId);

  auto identity = run_builder(builder, "identity --seed alice");
  EXPECT_EQ(identity,
            to_hex(launchpad::blake3::hash(std::string_view{"alice"})));
}
