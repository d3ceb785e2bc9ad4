#include <raceswap/schema/encoding/scale/account.hpp>

using namespace raceswap::schema;

namespace raceswap::schema::encoding::scale {

void encode(account<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.lamports, encoder);
  encode(o.data, encoder);
  encode(o.executable, encoder);
}

void decode(account<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.lamports, decoder);
  decode(o.data, decoder);
  decode(o.executable, decoder);
}

}  // namespace raceswap::schema::encoding::scale
