#pragma once

#include <cstdint>
#include <string>

namespace eclear {
namespace domain {

// -----------------------------------------------------------------------------
// Price / Quantity: fixed-point integer amounts
// -----------------------------------------------------------------------------
// Responsibility: Carry every monetary and energy amount in the clearing path
// as a signed 64-bit count of the smallest indivisible unit (e.g. micro-units
// of currency per Wh, Wh of energy).
//
// Why integers instead of double:
// - Two parties replaying the same bids must obtain the same outcome bit for
//   bit. Floating point sums depend on evaluation order; integer sums do not.
// - The settlement ledger works in integer base units, so the engine's
//   numbers can be handed over without rounding.
// - Signed so that a negative value read from an upstream record is
//   representable and can be rejected, instead of wrapping silently.
//
// All additions go through eclear::math::checked_add (see
// math/checked_arithmetic.hpp); overflow is reported, never wrapped.
// -----------------------------------------------------------------------------
using Price = std::int64_t;
using Quantity = std::int64_t;

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// Record ids are opaque strings issued by the record store. The engine only
// compares them (tie-break key, map lookups) and echoes them back.
// -----------------------------------------------------------------------------
using BidId = std::string;
using SupplyId = std::string;
using ParticipantId = std::string;
using TimeslotId = std::string;

// Millisecond timestamp (epoch-based) at which a record was committed by its
// participant. Used only to order records with equal price.
using SubmissionTime = std::int64_t;

}  // namespace domain
}  // namespace eclear
