#pragma once

#include <limits>
#include <string>

namespace trellis {

class Config;

/// How the shared cell size is derived from the visible children.
enum class CellSizePolicy {
    LastVisible,    // Natural size of the last visible child
    LargestVisible  // Component-wise maximum over the visible children
};

/// Caps and sizing policy for a uniform grid.
/// Values <= 0 for the caps are not rejected; they yield an empty layout.
struct UniformGridOptions {
    static constexpr int UNCAPPED = std::numeric_limits<int>::max();

    int maxRows = UNCAPPED;
    int maxColumns = UNCAPPED;
    CellSizePolicy cellSizePolicy = CellSizePolicy::LastVisible;

    /// Read options from `config` under `prefix` (e.g. "uniformGrid.maxRows").
    /// Missing or unrecognised keys keep their default.
    static UniformGridOptions fromConfig(const Config& config,
                                         const std::string& prefix = "uniformGrid");
};

const char* cellSizePolicyName(CellSizePolicy policy);

/// Parse "lastVisible" / "largestVisible". Returns false on anything else.
bool parseCellSizePolicy(const std::string& name, CellSizePolicy& out);

} // namespace trellis
