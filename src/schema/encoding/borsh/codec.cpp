#include <raceswap/schema/encoding/borsh/codec.hpp>

using namespace raceswap::schema;

namespace raceswap::schema::encoding::borsh {

void encode(writer& w, const uint8_t value) {
  w.write(value);
}

void encode(writer& w, const uint16_t value) {
  w.write(value);
}

void encode(writer& w, const uint32_t value) {
  w.write(value);
}

void encode(writer& w, const uint64_t value) {
  w.write(value);
}

void encode(writer& w, const bool value) {
  w.write(value);
}

void encode(writer& w, const bytes_t& value) {
  w.write(static_cast<uint32_t>(value.size()));
  w.write_bytes(bytes_view_t{value.data(), value.size()});
}

bool decode(reader& r, uint8_t& value) {
  return r.read(value);
}

bool decode(reader& r, uint16_t& value) {
  return r.read(value);
}

bool decode(reader& r, uint32_t& value) {
  return r.read(value);
}

bool decode(reader& r, uint64_t& value) {
  return r.read(value);
}

bool decode(reader& r, bool& value) {
  return r.read(value);
}

bool decode(reader& r, bytes_t& value) {
  auto count = uint32_t{};
  return r.read(count) && r.read_bytes(count, value);
}

void encode(writer& w, const full_account_reference_t& o) {
  encode(w, o.pubkey);
  encode(w, o.is_signer);
  encode(w, o.is_writable);
}

bool decode(reader& r, full_account_reference_t& o) {
  return decode(r, o.pubkey) && decode(r, o.is_signer) &&
         decode(r, o.is_writable);
}

void encode(writer& w, const indexed_account_reference_t& o) {
  encode(w, o.index);
  encode(w, o.is_writable);
}

bool decode(reader& r, indexed_account_reference_t& o) {
  return decode(r, o.index) && decode(r, o.is_writable);
}

void encode(writer& w, const serialized_instruction_t& o) {
  encode(w, o.accounts_len);
  encode(w, o.data);
  encode(w, o.is_writable);
  encode(w, o.is_signer);
}

bool decode(reader& r, serialized_instruction_t& o) {
  return decode(r, o.accounts_len) && decode(r, o.data) &&
         decode(r, o.is_writable) && decode(r, o.is_signer);
}

void encode(writer& w, const execute_swap_t& o) {
  encode(w, o.amount);
  encode(w, o.min_out);
  encode(w, o.accounts);
  encode(w, o.data);
}

bool decode(reader& r, execute_swap_t& o) {
  return decode(r, o.amount) && decode(r, o.min_out) &&
         decode(r, o.accounts) && decode(r, o.data);
}

void encode(writer& w, const execute_swap_indexed_t& o) {
  encode(w, o.amount);
  encode(w, o.min_out);
  encode(w, o.accounts);
  encode(w, o.data);
}

bool decode(reader& r, execute_swap_indexed_t& o) {
  return decode(r, o.amount) && decode(r, o.min_out) &&
         decode(r, o.accounts) && decode(r, o.data);
}

void encode(writer& w, const execute_raceswap_t& o) {
  encode(w, o.input_mint);
  encode(w, o.main_output_mint);
  encode(w, o.reflection_mint);
  encode(w, o.total_input_amount);
  encode(w, o.min_main_out);
  encode(w, o.min_reflection_out);
  encode(w, o.disable_reflection);
  encode(w, o.main_leg);
  encode(w, o.reflection_leg);
}

bool decode(reader& r, execute_raceswap_t& o) {
  return decode(r, o.input_mint) && decode(r, o.main_output_mint) &&
         decode(r, o.reflection_mint) && decode(r, o.total_input_amount) &&
         decode(r, o.min_main_out) && decode(r, o.min_reflection_out) &&
         decode(r, o.disable_reflection) && decode(r, o.main_leg) &&
         decode(r, o.reflection_leg);
}

void encode(writer& w, const fee_config_t& o) {
  encode(w, o.authority);
  encode(w, o.treasury_wallet);
  encode(w, o.reflection_fee_bps);
  encode(w, o.treasury_fee_bps);
  encode(w, o.bump);
  encode(w, o.authority_bump);
}

bool decode(reader& r, fee_config_t& o) {
  return decode(r, o.authority) && decode(r, o.treasury_wallet) &&
         decode(r, o.reflection_fee_bps) && decode(r, o.treasury_fee_bps) &&
         decode(r, o.bump) && decode(r, o.authority_bump);
}

void encode(writer& w, const initialize_config_t& o) {
  encode(w, o.authority);
  encode(w, o.treasury_wallet);
  encode(w, o.reflection_fee_bps);
  encode(w, o.treasury_fee_bps);
}

bool decode(reader& r, initialize_config_t& o) {
  return decode(r, o.authority) && decode(r, o.treasury_wallet) &&
         decode(r, o.reflection_fee_bps) && decode(r, o.treasury_fee_bps);
}

void encode(writer& w, const update_config_t& o) {
  encode(w, o.new_authority);
  encode(w, o.treasury_wallet);
  encode(w, o.reflection_fee_bps);
  encode(w, o.treasury_fee_bps);
}

bool decode(reader& r, update_config_t& o) {
  return decode(r, o.new_authority) && decode(r, o.treasury_wallet) &&
         decode(r, o.reflection_fee_bps) && decode(r, o.treasury_fee_bps);
}

void encode(writer& w, const swap_executed_t& o) {
  encode(w, o.user);
  encode(w, o.input_mint);
  encode(w, o.main_output_mint);
  encode(w, o.reflection_output_mint);
  encode(w, o.total_in);
  encode(w, o.main_amount);
  encode(w, o.reflection_amount);
  encode(w, o.treasury_amount);
}

bool decode(reader& r, swap_executed_t& o) {
  return decode(r, o.user) && decode(r, o.input_mint) &&
         decode(r, o.main_output_mint) &&
         decode(r, o.reflection_output_mint) && decode(r, o.total_in) &&
         decode(r, o.main_amount) && decode(r, o.reflection_amount) &&
         decode(r, o.treasury_amount);
}

void encode(writer& w, const config_updated_t& o) {
  encode(w, o.authority);
  encode(w, o.treasury_wallet);
  encode(w, o.reflection_fee_bps);
  encode(w, o.treasury_fee_bps);
}

bool decode(reader& r, config_updated_t& o) {
  return decode(r, o.authority) && decode(r, o.treasury_wallet) &&
         decode(r, o.reflection_fee_bps) && decode(r, o.treasury_fee_bps);
}

}  // namespace raceswap::schema::encoding::borsh
