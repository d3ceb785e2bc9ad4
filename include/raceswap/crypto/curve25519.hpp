#pragma once

#include <raceswap/schema/primitives.hpp>

namespace raceswap::crypto {

/// True when `point` decompresses to a point on the ed25519 curve. Program
/// derived addresses are required to fail this check so that no private key
/// can exist for them.
bool is_on_curve(const raceswap::schema::pubkey_t& point);

}  // namespace raceswap::crypto
