#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "config/config_schema.hpp"
#include "utils/common.hpp"

namespace ilbox::test_support {

class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("ilbox_test_" + utils::GenerateId(16))) {
        std::filesystem::create_directories(path_);
        path_ = std::filesystem::canonical(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void WriteText(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string ReadText(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

struct FakeEngineOptions {
    // Seconds the fake pip sleeps per package.
    std::string pip_delay = "0";
    // Value printed for `inspect --format {{.State.OOMKilled}}`.
    std::string oom_killed = "false";
};

// Writes a shell script that answers the engine CLI calls ilbox makes.
// `run` maps the -w directory back onto the -v host directory and executes
// stdin with /bin/sh there, so "python code" in tests is shell code. Every
// invocation is appended to calls.log next to the script.
inline std::filesystem::path WriteFakeEngine(const std::filesystem::path& dir,
                                             const FakeEngineOptions& options = {}) {
    const auto script = dir / "fake-engine";
    const auto log = dir / "calls.log";
    std::ofstream out(script, std::ios::trunc);
    out << "#!/bin/sh\n"
        << "echo \"$*\" >> '" << log.string() << "'\n"
        << "cmd=\"$1\"; shift\n"
        << "case \"$cmd\" in\n"
        << "  version) echo 24.0.7; exit 0 ;;\n"
        << "  image) if [ \"$2\" = missing:latest ]; then echo 'Error: No such image' >&2; exit 1; fi; exit 0 ;;\n"
        << "  pull) if [ \"$1\" = missing:latest ]; then echo 'pull access denied' >&2; exit 1; fi; exit 0 ;;\n"
        << "  inspect) echo " << options.oom_killed << "; exit 0 ;;\n"
        << "  rm) exit 0 ;;\n"
        << "  run) ;;\n"
        << "  *) echo \"unknown command $cmd\" >&2; exit 125 ;;\n"
        << "esac\n"
        << "src=''; dst=''; wd=''\n"
        << "while [ $# -gt 0 ]; do\n"
        << "  case \"$1\" in\n"
        << "    -i|--read-only) shift ;;\n"
        << "    -v) src=\"${2%%:*}\"; rest=\"${2#*:}\"; dst=\"${rest%%:*}\"; shift 2 ;;\n"
        << "    -w) wd=\"$2\"; shift 2 ;;\n"
        << "    -*) shift 2 ;;\n"
        << "    *) break ;;\n"
        << "  esac\n"
        << "done\n"
        << "image=\"$1\"; shift\n"
        << "if [ \"$image\" = missing:latest ]; then\n"
        << "  echo \"Unable to find image '$image' locally\" >&2; exit 125\n"
        << "fi\n"
        << "cd \"$src${wd#$dst}\" || exit 125\n"
        << "if [ \"$1\" = python ] && [ \"$2\" = -m ]; then\n"
        << "  while [ $# -gt 0 ] && [ \"$1\" != -t ]; do shift; done\n"
        << "  shift 2\n"
        << "  for pkg in \"$@\"; do\n"
        << "    echo \"Collecting $pkg\"\n"
        << "    sleep " << options.pip_delay << "\n"
        << "    case \"$pkg\" in fail*) echo \"ERROR: No matching distribution found for $pkg\" >&2; exit 1 ;; esac\n"
        << "    touch \"$pkg.installed\"\n"
        << "  done\n"
        << "  echo \"Successfully installed $*\"\n"
        << "  exit 0\n"
        << "fi\n"
        << "exec /bin/sh\n";
    out.close();
    std::filesystem::permissions(script,
                                 std::filesystem::perms::owner_all |
                                 std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
                                 std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
    return script;
}

inline config::RuntimeConfig FakeRuntimeConfig(const std::filesystem::path& engine,
                                               const std::string& image = "python:3.11-alpine") {
    config::RuntimeConfig runtime{};
    runtime.binary = engine.string();
    runtime.image = image;
    runtime.pull_on_startup = false;
    runtime.pull_timeout_s = 10;
    return runtime;
}

}  // namespace ilbox::test_support
