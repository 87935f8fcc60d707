#include "memtool/batch_script.hpp"

#include <array>

namespace aurix::memtool {

namespace {

constexpr std::array<std::string_view, 5> kProgramCommands = {
    "select_all_sections",
    "add_selected_sections",
    "program",
    "disconnect",
    "exit",
};

} // namespace

const char* ToString(BatchMode mode) {
    switch (mode) {
        case BatchMode::FullProgram:   return "full-program";
        case BatchMode::HaltAfterOpen: return "halt-after-open";
    }
    return "unknown";
}

std::string RenderBatchScript(BatchMode mode, std::string_view hex_path) {
    std::string out = "connect\nopen_file ";
    out.append(hex_path);
    out.push_back('\n');

    if (mode == BatchMode::HaltAfterOpen)
        return out;

    for (size_t i = 0; i < kProgramCommands.size(); ++i) {
        out.append(kProgramCommands[i]);
        // no newline after the final command
        if (i + 1 < kProgramCommands.size())
            out.push_back('\n');
    }
    return out;
}

} // namespace aurix::memtool
