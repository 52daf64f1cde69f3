#pragma once
#include <launchpad/schema/primitives.hpp>
#include <launchpad/schema/token_spec.hpp>

namespace launchpad::schema {

template <uint16_t Version>
struct token_state;

template <>
struct token_state<1> final {
  uint16_t version{1};
  address_t address{};
  account_id_t owner{};
  token_spec_t spec;
  amount_t minted;
};

using token_state_t = token_state<1>;

}  // namespace launchpad::schema
