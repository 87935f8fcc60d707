#pragma once

#include "memtool/workspace.hpp"
#include "io/artifact_writer.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/aurix_flash_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::string Join(const std::string& name) const { return path_ + "/" + name; }

  private:
    std::string path_;
};

inline void WriteFile(const std::string& path, const std::string& data) {
    std::ofstream os(path, std::ios::binary);
    if (!os.good())
        throw std::runtime_error("cannot create " + path);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!os.good())
        throw std::runtime_error("cannot write " + path);
}

inline std::string ReadFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good())
        return {};
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Shell script standing in for Memtool. Every run leaves in record_dir:
//   argv            one argument per line
//   config, batch   copies of the files named by $2 and $3
//   workspace_seen  present if the config file's directory existed while running
//   done            written right before exiting
struct FakeFlasher {
    std::string path;
    std::string record_dir;

    std::string Argv() const { return ReadFile(record_dir + "/argv"); }
    std::string Config() const { return ReadFile(record_dir + "/config"); }
    std::string Batch() const { return ReadFile(record_dir + "/batch"); }
    bool SawWorkspace() const { return std::filesystem::exists(record_dir + "/workspace_seen"); }
    bool Finished() const { return std::filesystem::exists(record_dir + "/done"); }
};

inline FakeFlasher MakeFakeFlasher(const TemporaryDirectory& tmp,
                                   const std::string& name,
                                   int exit_code,
                                   const std::string& delay_seconds = "") {
    FakeFlasher fake;
    fake.path = tmp.Join(name);
    fake.record_dir = tmp.Join(name + ".rec");
    std::filesystem::create_directories(fake.record_dir);

    std::string script;
    script += "#!/bin/sh\n";
    script += "rec='" + fake.record_dir + "'\n";
    script += "printf '%s\\n' \"$@\" > \"$rec/argv\"\n";
    script += "cp \"$2\" \"$rec/config\" 2>/dev/null\n";
    script += "cp \"$3\" \"$rec/batch\" 2>/dev/null\n";
    script += "if [ -d \"$(dirname \"$2\")\" ]; then : > \"$rec/workspace_seen\"; fi\n";
    if (!delay_seconds.empty()) {
        script += "sleep " + delay_seconds + "\n";
    }
    script += ": > \"$rec/done\"\n";
    script += "exit " + std::to_string(exit_code) + "\n";

    WriteFile(fake.path, script);
    if (::chmod(fake.path.c_str(), 0755) != 0) {
        throw std::runtime_error("chmod failed: " + std::string(std::strerror(errno)));
    }
    return fake;
}

// Real filesystem operations that remember the created directory and can be
// told to fail the write of one artifact.
class RecordingSystemOps final : public aurix::memtool::Workspace::ISystemOps {
  public:
    std::string fail_write_of;  // file name, e.g. "batch.mtb"

    mutable std::vector<std::string> created_dirs;
    mutable std::vector<std::string> written_files;
    mutable int remove_calls = 0;

    aurix::Result CreateTempDir(std::string_view temp_root,
                                std::string_view prefix,
                                std::string& out_dir) const override {
        std::string tmpl = std::string(temp_root) + "/" + std::string(prefix) + "XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data()))
            return aurix::Result::Fail(errno, "mkdtemp failed");
        out_dir = buf.data();
        created_dirs.push_back(out_dir);
        return aurix::Result::Ok();
    }

    aurix::Result WriteFile(const std::string& path, std::string_view contents) const override {
        if (!fail_write_of.empty() &&
            std::filesystem::path(path).filename().string() == fail_write_of) {
            return aurix::Result::Fail(ENOSPC, "write failed (No space left on device)");
        }
        written_files.push_back(path);
        return aurix::WriteArtifactFile(path, contents);
    }

    void RemoveTree(std::string_view dir) const override {
        ++remove_calls;
        std::error_code ec;
        std::filesystem::remove_all(std::filesystem::path(dir), ec);
    }
};

} // namespace testutil
