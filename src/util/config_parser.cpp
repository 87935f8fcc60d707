#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace aurix::config {

void FlashToolConfigFromFile::Reset() {
    udas_port.reset();
    halt_memtool.reset();
    log_level.reset();
    temp_root.clear();
    memtool_path.clear();
}

Result FlashToolConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::ConfigInvalid, -1, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::ConfigInvalid, -1, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace aurix::config
