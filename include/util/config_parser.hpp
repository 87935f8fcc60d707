#pragma once
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace aurix::config {

// Defaults read from /etc/aurix-flash/aurix-flash.conf (JSON). Every key is
// optional; command-line flags win over anything set here.
class FlashToolConfigFromFile {
public:
    std::optional<std::uint32_t> udas_port;
    std::optional<bool> halt_memtool;
    std::optional<LogLevel> log_level;
    std::string temp_root;
    std::string memtool_path;

    Result LoadFile(const std::string &path);

    void Reset();
};

} // namespace aurix::config
