#pragma once

#include <cstdint>
#include <string>

namespace aurix::memtool {

// Target configuration file passed to Memtool with "-c". The text is a fixed
// template; udas_port only fills the DasPortSel key of
// [Controller0.Core0.Tc2CoreTargIntf]. The last section is not terminated by
// a newline, matching the file Memtool itself writes.
std::string RenderMemtoolConfig(std::uint32_t udas_port);

} // namespace aurix::memtool
