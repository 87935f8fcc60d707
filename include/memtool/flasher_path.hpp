#pragma once

namespace aurix::memtool {

// Memtool executable fixed at configure time from $MEMTOOL_PATH.
const char* DefaultFlasherPath();

} // namespace aurix::memtool
