#include "memtool/flasher_path.hpp"

#ifndef AURIX_FLASH_MEMTOOL_PATH
#error "AURIX_FLASH_MEMTOOL_PATH must be defined by the build (set MEMTOOL_PATH when configuring)"
#endif

namespace aurix::memtool {

const char* DefaultFlasherPath() {
    return AURIX_FLASH_MEMTOOL_PATH;
}

} // namespace aurix::memtool
