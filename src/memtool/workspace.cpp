#include "memtool/workspace.hpp"

#include "io/artifact_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace aurix::memtool {

namespace {

class PosixSystemOps final : public Workspace::ISystemOps {
  public:
    Result CreateTempDir(std::string_view temp_root,
                         std::string_view prefix,
                         std::string& out_dir) const override {
        std::error_code ec;
        fs::path base = temp_root.empty() ? fs::temp_directory_path(ec) : fs::path(temp_root);
        if (ec) {
            return Result::Fail(ec.value(), "no temporary directory: " + ec.message());
        }
        base = fs::absolute(base, ec);
        if (ec) {
            return Result::Fail(ec.value(), "cannot resolve " + std::string(temp_root) + ": " +
                                                ec.message());
        }

        std::string tmpl = (base / (std::string(prefix) + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int e = errno;
            return Result::Fail(e, "mkdtemp " + tmpl + " failed: " + std::strerror(e));
        }

        out_dir = created;
        return Result::Ok();
    }

    Result WriteFile(const std::string& path, std::string_view contents) const override {
        return WriteArtifactFile(path, contents);
    }

    void RemoveTree(std::string_view dir) const override {
        std::error_code ec;
        fs::remove_all(fs::path(dir), ec);
        if (ec) {
            LogWarn("Cannot remove workspace %.*s: %s",
                    static_cast<int>(dir.size()), dir.data(), ec.message().c_str());
        }
    }
};

} // namespace

std::shared_ptr<const Workspace::ISystemOps> Workspace::DefaultSystemOps() {
    static const std::shared_ptr<const ISystemOps> kDefault = std::make_shared<PosixSystemOps>();
    return kDefault;
}

Workspace::Workspace() : system_ops_(DefaultSystemOps()) {}

Workspace::Workspace(std::shared_ptr<const ISystemOps> system_ops)
    : system_ops_(system_ops ? std::move(system_ops) : DefaultSystemOps()) {}

Workspace::Workspace(Workspace&& other) noexcept
    : system_ops_(std::move(other.system_ops_)), dir_(std::move(other.dir_)) {
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this == &other)
        return *this;
    Release();
    system_ops_ = std::move(other.system_ops_);
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    other.system_ops_ = DefaultSystemOps();
    return *this;
}

Workspace::~Workspace() { Release(); }

Result Workspace::Allocate(std::string_view temp_root, std::string_view prefix, Workspace& out) {
    out.Release();

    auto create_result = out.system_ops_->CreateTempDir(temp_root, prefix, out.dir_);
    if (!create_result.is_ok()) {
        out.dir_.clear();
        return create_result.WithContext(ErrorKind::WorkspaceUnavailable,
                                         "Cannot create temporary directory for memtool input");
    }

    LogDebug("Allocated workspace %s", out.dir_.c_str());
    return Result::Ok();
}

std::string Workspace::Path(std::string_view name) const {
    return (fs::path(dir_) / name).string();
}

Result Workspace::WriteFile(std::string_view name,
                            std::string_view contents,
                            std::string& out_path) const {
    if (dir_.empty())
        return Result::Fail(ErrorKind::ArtifactWriteFailed, -1, "workspace is not allocated");

    std::string path = Path(name);
    auto write_result = system_ops_->WriteFile(path, contents);
    if (!write_result.is_ok())
        return write_result;

    LogDebug("Wrote %s (%zu bytes)", path.c_str(), contents.size());
    out_path = std::move(path);
    return Result::Ok();
}

void Workspace::Release() {
    if (!dir_.empty()) {
        system_ops_->RemoveTree(dir_);
        LogDebug("Removed workspace %s", dir_.c_str());
        dir_.clear();
    }
}

} // namespace aurix::memtool
