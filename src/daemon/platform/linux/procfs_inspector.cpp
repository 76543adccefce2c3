#include "platform/linux/procfs_inspector.hpp"

#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

std::string ProcessEntry::command_line() const {
    if (argv.empty()) return comm;
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

ProcfsInspector::ProcfsInspector(std::string proc_root)
    : proc_root_(std::move(proc_root)) {
    long ticks = ::sysconf(_SC_CLK_TCK);
    if (ticks > 0) clock_ticks_ = ticks;

    // btime in /proc/stat anchors per-process start ticks to wall time
    std::ifstream f(proc_root_ + "/stat");
    std::string key;
    while (f >> key) {
        if (key == "btime") {
            long long btime = 0;
            f >> btime;
            boot_time_ = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(btime));
            break;
        }
        f.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
}

std::vector<ProcessEntry> ProcfsInspector::list_processes() const {
    std::vector<ProcessEntry> result;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        auto name = entry.path().filename().string();
        int pid = 0;
        auto [ptr, err] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (err != std::errc() || ptr != name.data() + name.size() || pid <= 0) continue;

        auto comm = read_comm(pid);
        if (comm.empty()) continue;  // exited while we were scanning

        result.push_back(ProcessEntry{
            .pid = pid,
            .comm = std::move(comm),
            .argv = read_cmdline(pid),
            .start_time = read_start_time(pid),
        });
    }

    return result;
}

std::string ProcfsInspector::working_dir(int pid) const {
    if (pid <= 0) return {};
    std::error_code ec;
    auto path = fs::read_symlink(std::format("{}/{}/cwd", proc_root_, pid), ec);
    if (ec) return {};
    return path.string();
}

std::string ProcfsInspector::read_comm(int pid) const {
    std::ifstream f(std::format("{}/{}/comm", proc_root_, pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::vector<std::string> ProcfsInspector::read_cmdline(int pid) const {
    std::ifstream f(std::format("{}/{}/cmdline", proc_root_, pid), std::ios::binary);
    if (!f.is_open()) return {};

    std::string raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    std::vector<std::string> args;
    std::string current;
    for (char c : raw) {
        if (c == '\0') {
            args.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) args.push_back(std::move(current));
    return args;
}

std::optional<std::chrono::system_clock::time_point> ProcfsInspector::read_start_time(int pid) const {
    if (boot_time_ == std::chrono::system_clock::time_point{}) return std::nullopt;

    std::ifstream f(std::format("{}/{}/stat", proc_root_, pid));
    if (!f.is_open()) return std::nullopt;
    std::string line;
    std::getline(f, line);

    // comm may contain spaces and parens; fields resume after the last ')'
    auto close = line.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream rest(line.substr(close + 1));
    std::string field;
    // starttime is field 22 overall, the 20th after comm
    for (int i = 0; i < 20; ++i) {
        if (!(rest >> field)) return std::nullopt;
    }

    unsigned long long ticks = 0;
    auto [ptr, err] = std::from_chars(field.data(), field.data() + field.size(), ticks);
    if (err != std::errc()) return std::nullopt;

    auto since_boot = std::chrono::milliseconds(ticks * 1000 / static_cast<unsigned long long>(clock_ticks_));
    return boot_time_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(since_boot);
}
