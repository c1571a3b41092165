// POWERBOND - Fixed Point Bonding Curve Implementation
// Copyright (c) 2024 POWERBOND Developers
// MIT License

#include <powerbond/exchange/curve.h>

namespace powerbond {
namespace exchange {

namespace {

// 306.25 * PRECISION (30625e16), the constant under the square root
constexpr Uint256 CURVE_OFFSET{0x9A12906AFF610000ULL, 0x10, 0, 0};

constexpr Uint256 TWO{2};
constexpr Uint256 FIVE{5};
constexpr Uint256 FIFTEEN{15};
constexpr Uint256 THIRTY{30};
constexpr Uint256 THIRTY_FIVE{35};

} // namespace

// ============================================================================
// Forward Curve
// ============================================================================

Uint256 VotingPowerFromBurned(const Uint256& burnedAmount) {
    // sqrt(inner) carries PRECISION_FIX; the factor below restores PRECISION
    Uint256 inner = CURVE_OFFSET + THIRTY * burnedAmount;
    Uint256 root = inner.Sqrt() * TWO * PRECISION_FIX;

    // At zero burn root is exactly 35 * PRECISION, so v(0) == 0
    Uint256 scaled = (root - FIVE * PRECISION) / THIRTY;
    return scaled - PRECISION;
}

// ============================================================================
// Inverse Curve
// ============================================================================

Uint256 BurnedFromVotingPower(const Uint256& votingPower) {
    Uint256 square = FIFTEEN * votingPower * votingPower / PRECISION;
    return (square + THIRTY_FIVE * votingPower) / TWO;
}

// ============================================================================
// Incremental Variants
// ============================================================================

Uint256 IncrementalVotingPower(const Uint256& deltaBurned, const Uint256& currentBurned) {
    return VotingPowerFromBurned(currentBurned + deltaBurned) -
           VotingPowerFromBurned(currentBurned);
}

Uint256 IncrementalBurnedAmount(const Uint256& deltaVotingPower,
                                const Uint256& currentVotingPower) {
    return BurnedFromVotingPower(currentVotingPower + deltaVotingPower) -
           BurnedFromVotingPower(currentVotingPower);
}

} // namespace exchange
} // namespace powerbond
