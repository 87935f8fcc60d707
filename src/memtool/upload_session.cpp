#include "memtool/upload_session.hpp"

#include "memtool/flasher_path.hpp"
#include "memtool/memtool_config.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <utility>
#include <vector>

namespace aurix::memtool {

Result UploadSession::Start(std::string_view firmware_hex,
                            BatchMode mode,
                            std::uint32_t udas_port,
                            const Options& opt,
                            UploadSession& out) {
    out = UploadSession{};

    // On any early return, session (and its workspace) goes out of scope.
    UploadSession session;
    session.workspace_ = Workspace(opt.system_ops);

    auto ws_result = Workspace::Allocate(opt.temp_root, kWorkspacePrefix, session.workspace_);
    if (!ws_result.is_ok())
        return ws_result;

    auto hex_result =
        session.workspace_.WriteFile(kFirmwareFileName, firmware_hex, session.firmware_path_);
    if (!hex_result.is_ok())
        return hex_result.WithContext(ErrorKind::ArtifactWriteFailed,
                                      "Cannot write temporary input hex file");

    auto cfg_result = session.workspace_.WriteFile(
        kConfigFileName, RenderMemtoolConfig(udas_port), session.config_path_);
    if (!cfg_result.is_ok())
        return cfg_result.WithContext(ErrorKind::ArtifactWriteFailed,
                                      "Cannot write temporary memtool configuration file");

    auto batch_result = session.workspace_.WriteFile(
        kBatchFileName, RenderBatchScript(mode, session.firmware_path_), session.batch_path_);
    if (!batch_result.is_ok())
        return batch_result.WithContext(ErrorKind::ArtifactWriteFailed,
                                        "Cannot write temporary memtool batch file");

    const std::string flasher = opt.flasher_path.empty() ? DefaultFlasherPath() : opt.flasher_path;
    const std::vector<std::string> args = {"-c", session.config_path_, session.batch_path_};

    LogDebug("Starting %s -c %s %s",
             flasher.c_str(), session.config_path_.c_str(), session.batch_path_.c_str());

    auto spawn_result = ChildProcess::Spawn(flasher, args, session.child_);
    if (!spawn_result.is_ok())
        return spawn_result.WithContext(ErrorKind::FlasherNotStartable,
                                        "Could not start memtool to flash device");

    LogInfo("Spawned Infineon Memtool to flash HEX file (pid=%d, udas_port=%u, mode=%s)",
            static_cast<int>(session.child_.Pid()), udas_port, ToString(mode));

    out = std::move(session);
    return Result::Ok();
}

Result UploadSession::Join(int* out_status) {
    if (joined_)
        return Result::Fail(ErrorKind::FlasherFailed, -1, "memtool was already waited on");
    if (!child_.Running())
        return Result::Fail(ErrorKind::FlasherFailed, -1, "no memtool process in this session");

    int status = 0;
    auto wait_result = child_.Wait(status);
    if (!wait_result.is_ok())
        return wait_result.WithContext(ErrorKind::FlasherFailed, "Cannot wait for memtool");
    joined_ = true;

    if (out_status)
        *out_status = status;

    if (!ExitedSuccessfully(status)) {
        return Result::Fail(ErrorKind::FlasherFailed, -1,
                            "Memtool did not exit with success (" + DescribeWaitStatus(status) + ")");
    }

    LogInfo("Infineon Memtool terminated successfully");
    return Result::Ok();
}

void UploadSession::Wait() {
    auto result = Join();
    if (!result.is_ok()) {
        LogError("%s", result.msg.c_str());
        // abort() skips destructors; memtool is reaped, so the files can go.
        workspace_.Release();
        std::abort();
    }
}

} // namespace aurix::memtool
