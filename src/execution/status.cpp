#include <raceswap/execution/status.hpp>

namespace raceswap::execution {

raceswap::schema::transaction_result_t make_result(const failure_t& failure) {
  auto result = raceswap::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(failure.code);
  result.log = std::string{raceswap::schema::to_string(failure.code)};
  result.info = failure.info;
  result.codespace = std::string{kSwapCodespace};
  return result;
}

}  // namespace raceswap::execution
