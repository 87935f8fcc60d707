#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>

namespace aurix::config::detail {

namespace {

// Present with the wrong type is an error; absent is not.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetPortIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<std::uint32_t>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0 || v > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
        err = std::string(key) + " out of range";
        return false;
    }
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, FlashToolConfigFromFile& cfg, std::string& err) {
    if (!GetPortIfPresent(j, "UdasPort", cfg.udas_port, err))
        return false;
    if (!GetBoolIfPresent(j, "HaltMemtool", cfg.halt_memtool, err))
        return false;
    if (!GetStringIfPresent(j, "TempRoot", cfg.temp_root, err))
        return false;
    if (!GetStringIfPresent(j, "MemtoolPath", cfg.memtool_path, err))
        return false;

    std::string level;
    if (!GetStringIfPresent(j, "LogLevel", level, err))
        return false;
    if (!level.empty()) {
        cfg.log_level = ParseLogLevel(level);
        if (!cfg.log_level.has_value()) {
            err = "unknown LogLevel '" + level + "'";
            return false;
        }
    }

    return true;
}

} // namespace aurix::config::detail
