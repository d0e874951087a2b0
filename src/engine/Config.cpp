#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <fstream>
#include <limits>

namespace trellis {

namespace {

bool parseInto(std::istream& in, nlohmann::json& out, std::string& error) {
    try {
        out = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        error = e.what();
        return false;
    }
    return true;
}

} // anonymous namespace

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DEBUG("Config: cannot open '{}'", path);
        return false;
    }

    nlohmann::json parsed;
    std::string error;
    if (!parseInto(file, parsed, error)) {
        LOG_WARN("Config: failed to parse '{}': {}", path, error);
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    nlohmann::json parsed = nlohmann::json::parse(jsonStr, nullptr, false);
    if (parsed.is_discarded()) {
        return false;
    }
    m_data = std::move(parsed);
    return true;
}

const nlohmann::json* Config::find(const std::string& key) const {
    const nlohmann::json* node = &m_data;
    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        if (dot == std::string::npos) dot = key.size();

        if (!node->is_object()) return nullptr;
        auto it = node->find(key.substr(start, dot - start));
        if (it == node->end()) return nullptr;
        node = &*it;
        start = dot + 1;
    }
    return node;
}

bool Config::hasKey(const std::string& key) const {
    return find(key) != nullptr;
}

bool Config::isInteger(const std::string& key) const {
    const auto* val = find(key);
    return val && val->is_number_integer();
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = find(key);
    return (val && val->is_string()) ? val->get<std::string>() : defaultVal;
}

int64_t Config::getInt64(const std::string& key, int64_t defaultVal) const {
    const auto* val = find(key);
    if (!val || !val->is_number_integer()) return defaultVal;

    if (val->is_number_unsigned()) {
        auto u = val->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return defaultVal;
        return static_cast<int64_t>(u);
    }
    return val->get<int64_t>();
}

int Config::getInt(const std::string& key, int defaultVal) const {
    if (!isInteger(key)) return defaultVal;

    int64_t wide = getInt64(key, std::numeric_limits<int64_t>::min());
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        LOG_WARN("Config: '{}' is outside the int range, using {}", key, defaultVal);
        return defaultVal;
    }
    return static_cast<int>(wide);
}

double Config::getDouble(const std::string& key, double defaultVal) const {
    const auto* val = find(key);
    return (val && val->is_number()) ? val->get<double>() : defaultVal;
}

double Config::getExtent(const std::string& key, double defaultVal) const {
    if (getString(key) == "infinite") return std::numeric_limits<double>::infinity();
    return getDouble(key, defaultVal);
}

} // namespace trellis
