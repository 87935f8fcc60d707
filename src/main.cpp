#include "image/firmware_loader.hpp"
#include "memtool/flasher_path.hpp"
#include "memtool/upload_session.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <limits>
#include <optional>
#include <string>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/aurix-flash/aurix-flash.conf";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -i <file.hex|file.hex.gz|-> [-p <udas-port>] [--halt] [-c <config>]\n"
        "\n"
        "Flashes an Intel-HEX image onto an AURIX TC39x with Infineon Memtool.\n"
        "A DAS server must already be running.\n"
        "\n"
        "Options:\n"
        "  -i, --input            HEX image path, '-' for stdin (*.gz is inflated)\n"
        "  -p, --port             UDAS port of the target (default 0)\n"
        "      --halt             Stop after opening the image and leave Memtool to the operator\n"
        "  -c, --config           Tool configuration (default %s)\n"
        "      --sha256           Expected SHA-256 of the (decompressed) image\n"
        "      --temp-dir         Directory for the temporary Memtool input files\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n"
        "\n"
        "Memtool: %s\n",
        argv, kDefaultConfigPath, aurix::memtool::DefaultFlasherPath());
}

std::optional<std::uint32_t> ParsePort(const char *s) {
    if (!s || *s == '\0' || *s == '-') return std::nullopt;
    char *end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0' || v > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(v);
}

enum LongOnly : int {
    kOptHalt = 0x100,
    kOptSha256,
    kOptTempDir,
};

} // namespace

int main(int argc, char **argv) {
    const char *in = nullptr;
    const char *config_cli = nullptr;
    std::optional<std::uint32_t> port_cli;
    bool halt_cli = false;
    bool verbose = false;
    std::string expected_sha256;
    std::string temp_dir_cli;

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"port", required_argument, nullptr, 'p'},
        {"halt", no_argument, nullptr, kOptHalt},
        {"config", required_argument, nullptr, 'c'},
        {"sha256", required_argument, nullptr, kOptSha256},
        {"temp-dir", required_argument, nullptr, kOptTempDir},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvi:p:c:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'v':
                verbose = true;
                break;

            case 'i':
                in = optarg;
                break;

            case 'p':
                port_cli = ParsePort(optarg);
                if (!port_cli) {
                    std::fprintf(stderr, "Invalid --port: %s\n", optarg);
                    return 2;
                }
                break;

            case 'c':
                config_cli = optarg;
                break;

            case kOptHalt:
                halt_cli = true;
                break;

            case kOptSha256:
                expected_sha256 = optarg;
                break;

            case kOptTempDir:
                temp_dir_cli = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!in || optind != argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    if (verbose) {
        aurix::Logger::Instance().SetLevel(aurix::LogLevel::Debug);
    }

    aurix::config::FlashToolConfigFromFile cfg;
    const std::string config_path = config_cli ? config_cli : kDefaultConfigPath;
    if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
        if (config_cli) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        // the default file is optional
        LogDebug("%s", r.msg.c_str());
    }

    if (!verbose && cfg.log_level.has_value()) {
        aurix::Logger::Instance().SetLevel(*cfg.log_level);
    }

    const std::uint32_t port = port_cli.value_or(cfg.udas_port.value_or(0));
    const bool halt = halt_cli || cfg.halt_memtool.value_or(false);
    const auto mode = halt ? aurix::memtool::BatchMode::HaltAfterOpen
                           : aurix::memtool::BatchMode::FullProgram;

    aurix::FirmwareImage image;
    if (auto r = aurix::FirmwareLoader::Load(in, expected_sha256, image); !r.is_ok()) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    aurix::memtool::UploadSession::Options opt;
    opt.flasher_path = cfg.memtool_path;
    opt.temp_root = temp_dir_cli.empty() ? cfg.temp_root : temp_dir_cli;

    aurix::memtool::UploadSession session;
    if (auto r = aurix::memtool::UploadSession::Start(image.hex, mode, port, opt, session);
        !r.is_ok()) {
        LogError("%s [%s]", r.msg.c_str(), aurix::ToString(r.kind));
        return 1;
    }

    if (halt) {
        // The workspace has to stay until the operator closes Memtool.
        LogInfo("Memtool left open for the operator (pid=%d)", static_cast<int>(session.FlasherPid()));
    }

    session.Wait();
    return 0;
}
