#pragma once

#include "memtool/batch_script.hpp"
#include "memtool/workspace.hpp"
#include "system/child_process.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace aurix::memtool {

// One upload of an Intel-HEX image with Infineon Memtool.
//
// Start() writes the image, a target configuration selecting the given UDAS
// port and a batch script into a private workspace, then launches Memtool on
// them. A DAS server must already be running.
//
// The workspace lives as long as the session. Releasing a session that was
// never waited on removes the workspace but leaves Memtool running, which is
// what HaltAfterOpen relies on.
class UploadSession {
  public:
    static constexpr std::string_view kFirmwareFileName = "input.hex";
    static constexpr std::string_view kConfigFileName = "temp_config.cfg";
    static constexpr std::string_view kBatchFileName = "batch.mtb";
    static constexpr std::string_view kWorkspacePrefix = "aurix-flash-";

    struct Options {
        std::string flasher_path;   // empty: DefaultFlasherPath()
        std::string temp_root;      // empty: system temporary directory
        std::shared_ptr<const Workspace::ISystemOps> system_ops;  // null: POSIX
    };

    UploadSession() = default;
    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;
    UploadSession(UploadSession&&) noexcept = default;
    UploadSession& operator=(UploadSession&&) noexcept = default;
    ~UploadSession() = default;

    static Result Start(std::string_view firmware_hex,
                        BatchMode mode,
                        std::uint32_t udas_port,
                        UploadSession& out) {
        return Start(firmware_hex, mode, udas_port, Options{}, out);
    }

    static Result Start(std::string_view firmware_hex,
                        BatchMode mode,
                        std::uint32_t udas_port,
                        const Options& opt,
                        UploadSession& out);

    // Waits for Memtool and reports a non-zero exit as FlasherFailed.
    // out_status receives the raw wait status when non-null.
    Result Join(int* out_status = nullptr);

    // Waits for Memtool. A failed run is fatal: it is logged and the process
    // aborts. Hangs for as long as Memtool does, e.g. when the flash layout
    // is broken or another debugger holds the target.
    void Wait();

    bool Active() const { return workspace_.Allocated(); }
    const std::string& WorkspaceDir() const { return workspace_.Dir(); }
    const std::string& FirmwarePath() const { return firmware_path_; }
    const std::string& ConfigPath() const { return config_path_; }
    const std::string& BatchPath() const { return batch_path_; }
    pid_t FlasherPid() const { return child_.Pid(); }

  private:
    // Declared first so it is destroyed after the child handle.
    Workspace workspace_;
    ChildProcess child_;
    std::string firmware_path_;
    std::string config_path_;
    std::string batch_path_;
    bool joined_ = false;
};

} // namespace aurix::memtool
