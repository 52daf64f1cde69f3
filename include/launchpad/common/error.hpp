#pragma once

#include <launchpad/schema/transaction_error_code.hpp>

#include <stdexcept>
#include <string>

namespace launchpad::common {

/// Domain failure raised by a component operation. Throwing from inside a
/// journal scope rolls back every mutation made earlier in the call chain.
class error final : public std::runtime_error {
 public:
  error(const schema::transaction_error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  schema::transaction_error_code code() const noexcept { return code_; }

  schema::error_category category() const noexcept {
    return schema::category_of(code_);
  }

 private:
  schema::transaction_error_code code_;
};

[[noreturn]] inline void fail(const schema::transaction_error_code code,
                              const std::string& message) {
  throw error{code, message};
}

}  // namespace launchpad::common
