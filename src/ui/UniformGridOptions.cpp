#include "ui/UniformGridOptions.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <cstdint>
#include <limits>

namespace trellis {

namespace {

int readCap(const Config& config, const std::string& key, int fallback) {
    if (!config.hasKey(key)) return fallback;

    if (config.getString(key) == "unbounded") {
        return UniformGridOptions::UNCAPPED;
    }
    if (config.isInteger(key)) {
        // Values past INT64_MAX come back as the minimum and fail the range check
        int64_t wide = config.getInt64(key, std::numeric_limits<int64_t>::min());
        if (wide >= std::numeric_limits<int>::min() && wide <= std::numeric_limits<int>::max()) {
            return static_cast<int>(wide);
        }
        LOG_WARN("Config: '{}' is outside the int range, keeping default", key);
        return fallback;
    }

    LOG_WARN("Config: '{}' must be an integer or \"unbounded\", keeping default", key);
    return fallback;
}

} // anonymous namespace

UniformGridOptions UniformGridOptions::fromConfig(const Config& config, const std::string& prefix) {
    UniformGridOptions options;
    options.maxRows = readCap(config, prefix + ".maxRows", options.maxRows);
    options.maxColumns = readCap(config, prefix + ".maxColumns", options.maxColumns);

    const std::string policyKey = prefix + ".cellSize";
    if (config.hasKey(policyKey)) {
        std::string name = config.getString(policyKey);
        if (!parseCellSizePolicy(name, options.cellSizePolicy)) {
            LOG_WARN("Config: unknown cell size policy '{}' for '{}', using '{}'",
                     name, policyKey, cellSizePolicyName(options.cellSizePolicy));
        }
    }
    return options;
}

const char* cellSizePolicyName(CellSizePolicy policy) {
    switch (policy) {
        case CellSizePolicy::LastVisible:    return "lastVisible";
        case CellSizePolicy::LargestVisible: return "largestVisible";
    }
    return "lastVisible";
}

bool parseCellSizePolicy(const std::string& name, CellSizePolicy& out) {
    if (name == "lastVisible") {
        out = CellSizePolicy::LastVisible;
        return true;
    }
    if (name == "largestVisible") {
        out = CellSizePolicy::LargestVisible;
        return true;
    }
    return false;
}

} // namespace trellis
