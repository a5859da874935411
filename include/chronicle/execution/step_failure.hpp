#pragma once

#include <chronicle/schema/error_code.hpp>

#include <stdexcept>
#include <string>

namespace chronicle::execution {

/// Worker failure that another attempt cannot fix (version conflict, missing
/// row, scope violation). The job runner stops on the first one; every other
/// exception is retried.
class step_failure final : public std::runtime_error {
 public:
  step_failure(chronicle::schema::error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  chronicle::schema::error_code code() const noexcept { return code_; }

 private:
  chronicle::schema::error_code code_;
};

}  // namespace chronicle::execution
