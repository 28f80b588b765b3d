#pragma once

namespace topomap {

/// Tuning knobs for LinkRouter. The numeric weights are balanced against
/// the fixed step and turn costs; changing them changes every route.
struct RouterOptions {
    bool avoidNodes = true;                ///< Never route through other nodes' cells
    bool attachMultiCellsCardinal = true;  ///< Enter multi-cell goal nodes axis-aligned only
    bool spreadLinks = true;               ///< Nudge parallel links apart
    bool orthogonal = false;               ///< Disable diagonal moves entirely

    /// Multiplier for the accumulated crossing / overlap penalty.
    /// Higher values make routes detour further to avoid other links.
    float linkPenaltyWeight = 10.0f;

    int searchLimit = 8192;    ///< A* iteration cap per link
    int routeIterLimit = 32;   ///< Round cap for the fix-point pass
};

}  // namespace topomap
