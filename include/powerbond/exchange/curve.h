// POWERBOND - Fixed Point Bonding Curve
// Copyright (c) 2024 POWERBOND Developers
// MIT License
//
// Maps cumulative burned utility tokens to granted voting power and back.
// All values are fixed-point with 18 decimals.
//
//   forward:  v = (2 * sqrt(306.25 + 30x) - 5) / 30 - 1
//   inverse:  x = (15v^2 + 35v) / 2
//
// Arithmetic is checked: a would-be underflow or overflow throws.

#ifndef POWERBOND_EXCHANGE_CURVE_H
#define POWERBOND_EXCHANGE_CURVE_H

#include <powerbond/core/uint256.h>

namespace powerbond {
namespace exchange {

// ============================================================================
// Constants
// ============================================================================

/// Fixed-point scale (10^18)
inline constexpr Uint256 PRECISION{1000000000000000000ULL};

/// Square root scale compensation (10^9, sqrt of PRECISION)
inline constexpr Uint256 PRECISION_FIX{1000000000ULL};

/// Smallest amount accepted by an exchange (1 token)
inline constexpr Uint256 MIN_EXCHANGE_AMOUNT{1000000000000000000ULL};

/// Voting power cap a fresh CapPolicy starts with (100 tokens)
inline constexpr Uint256 DEFAULT_VOTING_POWER_CAP{0x6BC75E2D63100000ULL, 5, 0, 0};

// ============================================================================
// Curve
// ============================================================================

/**
 * Voting power for a cumulative burned amount.
 *
 * Inputs below 1166666667 units truncate to zero.
 */
Uint256 VotingPowerFromBurned(const Uint256& burnedAmount);

/// Burned amount needed to reach a voting power (exact polynomial)
Uint256 BurnedFromVotingPower(const Uint256& votingPower);

/**
 * Voting power gained by burning deltaBurned on top of currentBurned.
 * @throws std::overflow_error if currentBurned + deltaBurned does not fit
 */
Uint256 IncrementalVotingPower(const Uint256& deltaBurned, const Uint256& currentBurned);

/**
 * Burn cost of raising voting power by deltaVotingPower from currentVotingPower.
 * @throws std::overflow_error on overflow
 */
Uint256 IncrementalBurnedAmount(const Uint256& deltaVotingPower,
                                const Uint256& currentVotingPower);

} // namespace exchange
} // namespace powerbond

#endif // POWERBOND_EXCHANGE_CURVE_H
