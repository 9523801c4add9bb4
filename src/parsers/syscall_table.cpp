/**
 * @file syscall_table.cpp
 * @brief Implementation of syscall name / identifier mapping
 *
 * @date 2025
 */

#include "sysgram/parsers/syscall_table.hpp"
#include "sysgram/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace sysgram {
namespace parsers {

namespace {

// x86_64 syscall numbers (arch/x86/entry/syscalls/syscall_64.tbl)
const std::pair<const char*, core::SyscallId> kX86_64Syscalls[] = {
    {"read", 0}, {"write", 1}, {"open", 2}, {"close", 3}, {"stat", 4},
    {"fstat", 5}, {"lstat", 6}, {"poll", 7}, {"lseek", 8}, {"mmap", 9},
    {"mprotect", 10}, {"munmap", 11}, {"brk", 12}, {"rt_sigaction", 13},
    {"rt_sigprocmask", 14}, {"rt_sigreturn", 15}, {"ioctl", 16}, {"pread64", 17},
    {"pwrite64", 18}, {"readv", 19}, {"writev", 20}, {"access", 21}, {"pipe", 22},
    {"select", 23}, {"sched_yield", 24}, {"mremap", 25}, {"msync", 26},
    {"mincore", 27}, {"madvise", 28}, {"shmget", 29}, {"shmat", 30}, {"shmctl", 31},
    {"dup", 32}, {"dup2", 33}, {"pause", 34}, {"nanosleep", 35}, {"getitimer", 36},
    {"alarm", 37}, {"setitimer", 38}, {"getpid", 39}, {"sendfile", 40},
    {"socket", 41}, {"connect", 42}, {"accept", 43}, {"sendto", 44},
    {"recvfrom", 45}, {"sendmsg", 46}, {"recvmsg", 47}, {"shutdown", 48},
    {"bind", 49}, {"listen", 50}, {"getsockname", 51}, {"getpeername", 52},
    {"socketpair", 53}, {"setsockopt", 54}, {"getsockopt", 55}, {"clone", 56},
    {"fork", 57}, {"vfork", 58}, {"execve", 59}, {"exit", 60}, {"wait4", 61},
    {"kill", 62}, {"uname", 63}, {"semget", 64}, {"semop", 65}, {"semctl", 66},
    {"shmdt", 67}, {"msgget", 68}, {"msgsnd", 69}, {"msgrcv", 70}, {"msgctl", 71},
    {"fcntl", 72}, {"flock", 73}, {"fsync", 74}, {"fdatasync", 75},
    {"truncate", 76}, {"ftruncate", 77}, {"getdents", 78}, {"getcwd", 79},
    {"chdir", 80}, {"fchdir", 81}, {"rename", 82}, {"mkdir", 83}, {"rmdir", 84},
    {"creat", 85}, {"link", 86}, {"unlink", 87}, {"symlink", 88},
    {"readlink", 89}, {"chmod", 90}, {"fchmod", 91}, {"chown", 92},
    {"fchown", 93}, {"lchown", 94}, {"umask", 95}, {"gettimeofday", 96},
    {"getrlimit", 97}, {"getrusage", 98}, {"sysinfo", 99}, {"times", 100},
    {"ptrace", 101}, {"getuid", 102}, {"syslog", 103}, {"getgid", 104},
    {"setuid", 105}, {"setgid", 106}, {"geteuid", 107}, {"getegid", 108},
    {"setpgid", 109}, {"getppid", 110}, {"getpgrp", 111}, {"setsid", 112},
    {"getgroups", 115}, {"setgroups", 116}, {"setresuid", 117},
    {"getresuid", 118}, {"setresgid", 119}, {"getresgid", 120}, {"getpgid", 121},
    {"getsid", 124}, {"capget", 125}, {"capset", 126}, {"rt_sigpending", 127},
    {"rt_sigtimedwait", 128}, {"rt_sigsuspend", 130}, {"sigaltstack", 131},
    {"utime", 132}, {"mknod", 133}, {"statfs", 137}, {"fstatfs", 138},
    {"mlock", 149}, {"munlock", 150}, {"pivot_root", 155}, {"prctl", 157},
    {"arch_prctl", 158}, {"setrlimit", 160}, {"chroot", 161}, {"sync", 162},
    {"mount", 165}, {"umount2", 166}, {"reboot", 169}, {"sethostname", 170},
    {"init_module", 175}, {"delete_module", 176}, {"gettid", 186},
    {"setxattr", 188}, {"getxattr", 191}, {"tkill", 200}, {"time", 201},
    {"futex", 202}, {"sched_setaffinity", 203}, {"sched_getaffinity", 204},
    {"getdents64", 217}, {"set_tid_address", 218}, {"timer_create", 222},
    {"clock_settime", 227}, {"clock_gettime", 228}, {"clock_getres", 229},
    {"clock_nanosleep", 230}, {"exit_group", 231}, {"epoll_wait", 232},
    {"epoll_ctl", 233}, {"tgkill", 234}, {"kexec_load", 246}, {"add_key", 248},
    {"keyctl", 250}, {"inotify_init", 253}, {"inotify_add_watch", 254},
    {"inotify_rm_watch", 255}, {"openat", 257}, {"mkdirat", 258},
    {"fchownat", 260}, {"newfstatat", 262}, {"unlinkat", 263}, {"renameat", 264},
    {"linkat", 265}, {"symlinkat", 266}, {"readlinkat", 267}, {"fchmodat", 268},
    {"pselect6", 270}, {"ppoll", 271}, {"unshare", 272}, {"set_robust_list", 273},
    {"utimensat", 280}, {"epoll_pwait", 281}, {"timerfd_create", 283},
    {"eventfd", 284}, {"fallocate", 285}, {"timerfd_settime", 286},
    {"timerfd_gettime", 287}, {"accept4", 288}, {"signalfd4", 289},
    {"eventfd2", 290}, {"epoll_create1", 291}, {"dup3", 292}, {"pipe2", 293},
    {"inotify_init1", 294}, {"preadv", 295}, {"pwritev", 296}, {"recvmmsg", 299},
    {"prlimit64", 302}, {"sendmmsg", 307}, {"setns", 308},
    {"process_vm_readv", 310}, {"process_vm_writev", 311}, {"finit_module", 313},
    {"renameat2", 316}, {"seccomp", 317}, {"getrandom", 318},
    {"memfd_create", 319}, {"kexec_file_load", 320}, {"bpf", 321},
    {"execveat", 322}, {"userfaultfd", 323}, {"mlock2", 325},
    {"copy_file_range", 326}, {"preadv2", 327}, {"pwritev2", 328}, {"statx", 332},
    {"rseq", 334}, {"pidfd_send_signal", 424}, {"io_uring_setup", 425},
    {"io_uring_enter", 426}, {"io_uring_register", 427}, {"pidfd_open", 434},
    {"clone3", 435}, {"faccessat2", 439}
};

core::SyscallId ParseId(const std::string& text, const std::string& context) {
    try {
        std::size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return static_cast<core::SyscallId>(value);
    }
    catch (const std::logic_error&) {
        throw core::ConfigurationError("invalid syscall id '" + text + "' in " + context);
    }
}

} // anonymous namespace

SyscallTable SyscallTable::BuiltIn() {
    SyscallTable table;
    for (const auto& [name, id] : kX86_64Syscalls) {
        table.Add(name, id);
    }
    return table;
}

SyscallTable SyscallTable::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::ConfigurationError("cannot open syscall mapping file: " + path.string());
    }

    json j;
    try {
        j = json::parse(file);
    }
    catch (const json::parse_error& e) {
        throw core::ConfigurationError("cannot parse syscall mapping " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) {
        throw core::ConfigurationError("syscall mapping must be a JSON object: " + path.string());
    }

    SyscallTable table = BuiltIn();
    const std::string context = path.string();

    try {
        if (j.contains("names")) {
            for (const auto& item : j.at("names").items()) {
                table.Add(item.key(), item.value().get<core::SyscallId>());
            }
        }

        const char* map_key = j.contains("id_map") ? "id_map" :
                              j.contains("syscall_seq") ? "syscall_seq" : nullptr;
        if (map_key) {
            for (const auto& item : j.at(map_key).items()) {
                table.MapId(ParseId(item.key(), context), item.value().get<core::SyscallId>());
            }
        }
    }
    catch (const json::exception& e) {
        throw core::ConfigurationError("malformed syscall mapping " + context + ": " + e.what());
    }

    spdlog::info("Loaded syscall mapping from {} ({} names, {} mapped ids)",
                 context, table.Size(), table.id_map_.size());
    return table;
}

void SyscallTable::Add(const std::string& name, core::SyscallId raw_id) {
    auto it = ids_.find(name);
    if (it != ids_.end()) {
        names_.erase(it->second);
    }
    ids_[name] = raw_id;
    names_[raw_id] = name;
}

void SyscallTable::MapId(core::SyscallId raw_id, core::SyscallId canonical_id) {
    id_map_[raw_id] = canonical_id;
}

std::optional<core::SyscallId> SyscallTable::Resolve(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return Canonicalize(it->second);
}

std::optional<core::SyscallId> SyscallTable::Canonicalize(core::SyscallId raw_id) const {
    if (id_map_.empty()) {
        return raw_id;
    }

    auto it = id_map_.find(raw_id);
    if (it == id_map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> SyscallTable::NameOf(core::SyscallId raw_id) const {
    auto it = names_.find(raw_id);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace parsers
} // namespace sysgram
