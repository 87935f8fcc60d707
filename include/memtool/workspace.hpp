#pragma once

#include "util/result.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace aurix::memtool {

// Exclusively owned temporary directory holding the files Memtool reads.
// The directory and everything below it is removed when the handle is
// destroyed, move-assigned over, or Release()d.
class Workspace {
  public:
    class ISystemOps {
      public:
        virtual ~ISystemOps() = default;
        virtual Result CreateTempDir(std::string_view temp_root,
                                     std::string_view prefix,
                                     std::string& out_dir) const = 0;
        virtual Result WriteFile(const std::string& path, std::string_view contents) const = 0;
        virtual void RemoveTree(std::string_view dir) const = 0;
    };

    Workspace();
    explicit Workspace(std::shared_ptr<const ISystemOps> system_ops);
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    ~Workspace();

    // Creates <temp_root>/<prefix>XXXXXX. An empty temp_root means the
    // system temporary directory ($TMPDIR, else /tmp).
    static Result Allocate(std::string_view temp_root,
                           std::string_view prefix,
                           Workspace& out);

    // Absolute path of a file directly inside the workspace.
    std::string Path(std::string_view name) const;

    // Writes name inside the workspace and reports its absolute path.
    Result WriteFile(std::string_view name, std::string_view contents, std::string& out_path) const;

    void Release();

    const std::string& Dir() const { return dir_; }
    bool Allocated() const { return !dir_.empty(); }

  private:
    static std::shared_ptr<const ISystemOps> DefaultSystemOps();

    std::shared_ptr<const ISystemOps> system_ops_;
    std::string dir_;
};

} // namespace aurix::memtool
