#include <raceswap/crypto/sha256.hpp>
#include <raceswap/schema/encoding/borsh/encoder.hpp>
#include <raceswap/schema/program_instruction.hpp>

#include <algorithm>
#include <iterator>
#include <string>

namespace raceswap::schema {

namespace {

using encoder_t =
    raceswap::schema::encoding::encoder<encoding::borsh_encoder_tag>;

discriminator_t namespaced_discriminator(const std::string_view space,
                                         const std::string_view name) {
  auto preimage = std::string{space};
  preimage.push_back(':');
  preimage.append(name);
  auto digest = raceswap::crypto::sha256(std::string_view{preimage});
  auto out = discriminator_t{};
  std::copy_n(std::begin(digest), out.size(), std::begin(out));
  return out;
}

bool has_discriminator(const bytes_view_t& data, const discriminator_t& tag) {
  return data.size() >= tag.size() &&
         std::equal(std::begin(tag), std::end(tag), std::begin(data));
}

template <typename T>
std::optional<program_instruction_t> decode_body(const bytes_view_t& body) {
  auto decoded = encoder_t{}.try_decode<T>(body);
  if (!decoded) {
    return std::nullopt;
  }
  return program_instruction_t{std::move(*decoded)};
}

template <typename T>
bytes_t encode_framed(const discriminator_t& tag, const T& value) {
  auto out = bytes_t{std::begin(tag), std::end(tag)};
  encoder_t{}.encode(value, out);
  return out;
}

}  // namespace

discriminator_t instruction_discriminator(const std::string_view name) {
  return namespaced_discriminator("global", name);
}

discriminator_t account_discriminator(const std::string_view name) {
  return namespaced_discriminator("account", name);
}

discriminator_t event_discriminator(const std::string_view name) {
  return namespaced_discriminator("event", name);
}

std::optional<program_instruction_t> try_decode_instruction(
    const bytes_view_t& data,
    const account_encoding_t encoding) {
  if (data.size() < kDiscriminatorSize) {
    return std::nullopt;
  }
  auto body = data.subspan(kDiscriminatorSize);
  if (has_discriminator(data, instruction_discriminator(kExecuteSwapName))) {
    switch (encoding) {
      case account_encoding_t::full:
        return decode_body<execute_swap_t>(body);
      case account_encoding_t::indexed:
        return decode_body<execute_swap_indexed_t>(body);
    }
    return std::nullopt;
  }
  if (has_discriminator(data,
                        instruction_discriminator(kExecuteRaceswapName))) {
    return decode_body<execute_raceswap_t>(body);
  }
  if (has_discriminator(data,
                        instruction_discriminator(kInitializeConfigName))) {
    return decode_body<initialize_config_t>(body);
  }
  if (has_discriminator(data, instruction_discriminator(kUpdateConfigName))) {
    return decode_body<update_config_t>(body);
  }
  return std::nullopt;
}

bytes_t encode_instruction(const program_instruction_t& instruction) {
  return std::visit(
      overloaded{
          [](const initialize_config_t& value) {
            return encode_framed(
                instruction_discriminator(kInitializeConfigName), value);
          },
          [](const update_config_t& value) {
            return encode_framed(instruction_discriminator(kUpdateConfigName),
                                 value);
          },
          [](const execute_raceswap_t& value) {
            return encode_framed(
                instruction_discriminator(kExecuteRaceswapName), value);
          },
          [](const execute_swap_t& value) {
            return encode_framed(instruction_discriminator(kExecuteSwapName),
                                 value);
          },
          [](const execute_swap_indexed_t& value) {
            return encode_framed(instruction_discriminator(kExecuteSwapName),
                                 value);
          }},
      instruction);
}

bytes_t encode_config_account(const fee_config_t& config) {
  return encode_framed(account_discriminator(kConfigAccountName), config);
}

std::optional<fee_config_t> try_decode_config_account(
    const bytes_view_t& data) {
  if (data.size() < kConfigAccountSize ||
      !has_discriminator(data, account_discriminator(kConfigAccountName))) {
    return std::nullopt;
  }
  return encoder_t{}.try_decode<fee_config_t>(
      data.subspan(kDiscriminatorSize, kFeeConfigRecordSize));
}

bytes_t encode_event(const swap_executed_t& event) {
  return encode_framed(event_discriminator(kSwapExecutedName), event);
}

bytes_t encode_event(const config_updated_t& event) {
  return encode_framed(event_discriminator(kConfigUpdatedName), event);
}

}  // namespace raceswap::schema
