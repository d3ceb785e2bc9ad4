#include <raceswap/runtime/host.hpp>

#include <utility>

namespace raceswap::runtime {

raceswap::schema::transaction_result_t make_runtime_error(
    const runtime_error_code code,
    std::string info) {
  auto result = raceswap::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{kRuntimeCodespace};
  return result;
}

}  // namespace raceswap::runtime
