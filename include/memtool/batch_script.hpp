#pragma once

#include <string>
#include <string_view>

namespace aurix::memtool {

enum class BatchMode {
    // connect, open, program every section, disconnect, exit
    FullProgram,
    // connect and open the image, then leave Memtool to the operator
    HaltAfterOpen,
};

const char* ToString(BatchMode mode);

// Memtool batch (.mtb) script, one command per line. hex_path is emitted as
// a bare token, so it must not contain whitespace.
std::string RenderBatchScript(BatchMode mode, std::string_view hex_path);

} // namespace aurix::memtool
