#pragma once

#include <raceswap/schema/swap_error_code.hpp>
#include <raceswap/schema/transaction_result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace raceswap::execution {

inline constexpr auto kSwapCodespace = std::string_view{"raceswap"};

/// A rejected request: the code clients see plus free-form detail.
struct failure_t final {
  raceswap::schema::swap_error_code code{};
  std::string info;
};

/// Empty on success.
using status_t = std::optional<failure_t>;

inline failure_t fail(const raceswap::schema::swap_error_code code,
                      std::string info = {}) {
  return failure_t{.code = code, .info = std::move(info)};
}

raceswap::schema::transaction_result_t make_result(const failure_t& failure);

}  // namespace raceswap::execution
