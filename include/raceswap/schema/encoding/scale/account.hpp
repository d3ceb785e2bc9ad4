#pragma once
#include <raceswap/schema/account.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace raceswap::schema::encoding::scale {

void encode(account<1>&& o, ::scale::Encoder& encoder);
void decode(account<1>&& o, ::scale::Decoder& decoder);

}  // namespace raceswap::schema::encoding::scale
