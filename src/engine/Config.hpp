#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace trellis {

/// Read-only JSON settings addressed by dot-separated key paths,
/// e.g. "uniformGrid.maxRows".
class Config {
public:
    /// Load from a JSON file. Returns false if the file cannot be read or
    /// parsed; the current settings are kept on failure.
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& jsonStr);

    bool hasKey(const std::string& key) const;
    bool isInteger(const std::string& key) const;

    // Getters return the default when the key is missing or of another type.
    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;   // also when outside int range
    int64_t     getInt64(const std::string& key, int64_t defaultVal = 0) const;
    double      getDouble(const std::string& key, double defaultVal = 0.0) const;

    /// A length along one axis: a number, or "infinite" for +infinity.
    double getExtent(const std::string& key, double defaultVal) const;

private:
    const nlohmann::json* find(const std::string& key) const;

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace trellis
