#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace aurix::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, FlashToolConfigFromFile& cfg, std::string& err);

} // namespace aurix::config::detail
