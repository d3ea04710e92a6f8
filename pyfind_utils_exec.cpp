#include "pyfind_utils.h"
#include <cerrno>
#include <cstring>
#ifdef _WIN32
#include <windows.h>
#include <thread>
#else
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>
#endif

#ifndef _WIN32
namespace {

struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() { if (fd >= 0) ::close(fd); fd = -1; }
};

bool make_pipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe(fds) != 0) return false;
    read_end.fd = fds[0];
    write_end.fd = fds[1];
    return ::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == 0 && ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == 0;
}

std::vector<std::string> env_block(const Env& env) {
    std::vector<std::string> block;
    block.reserve(env.size());
    for (const auto& [k, v] : env) block.push_back(k + "=" + v);
    return block;
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& args, const Env& env) {
    ProcessResult result;
    if (args.empty()) return {EINVAL, "", std::strerror(EINVAL)};
    Fd out_r, out_w, err_r, err_w, exec_r, exec_w;
    if (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w) || !make_pipe(exec_r, exec_w)) {
        int e = errno;
        return {e, "", std::strerror(e)};
    }

    std::vector<std::string> envs = env_block(env);
    std::vector<char*> argv, envp;
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    for (const auto& e : envs) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        return {e, "", std::strerror(e)};
    }
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (::dup2(out_w.fd, STDOUT_FILENO) < 0 || ::dup2(err_w.fd, STDERR_FILENO) < 0) _exit(127);
        ::execve(argv[0], argv.data(), envp.data());
        // exec failed, report errno through the close-on-exec pipe
        int e = errno;
        ssize_t ignored = ::write(exec_w.fd, &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    out_w.reset();
    err_w.reset();
    exec_w.reset();

    int exec_errno = 0;
    ssize_t got = ::read(exec_r.fd, &exec_errno, sizeof(exec_errno));

    pollfd fds[2] = {{out_r.fd, POLLIN, 0}, {err_r.fd, POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    int open_streams = 2;
    char buffer[4096];
    while (open_streams > 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) { sinks[i]->append(buffer, static_cast<size_t>(n)); continue; }
            if (n < 0 && errno == EINTR) continue;
            fds[i].fd = -1;
            --open_streams;
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (got == static_cast<ssize_t>(sizeof(exec_errno)) && exec_errno != 0) {
        return {exec_errno, "", std::strerror(exec_errno)};
    }
    if (WIFEXITED(status)) result.code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.code = 128 + WTERMSIG(status);
    else result.code = 1;
    return result;
}

#else

namespace {

struct Handle {
    HANDLE h = nullptr;
    Handle() = default;
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;
    ~Handle() { reset(); }
    void reset() { if (h && h != INVALID_HANDLE_VALUE) CloseHandle(h); h = nullptr; }
};

std::string quote_windows(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') { ++backslashes; continue; }
        if (c == '"') out.append(backslashes * 2 + 1, '\\');
        else out.append(backslashes, '\\');
        backslashes = 0;
        out += c;
    }
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

void drain(HANDLE h, std::string& sink) {
    char buffer[4096];
    DWORD n = 0;
    while (ReadFile(h, buffer, sizeof(buffer), &n, nullptr) && n > 0) sink.append(buffer, n);
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& args, const Env& env) {
    ProcessResult result;
    if (args.empty()) return {ERROR_INVALID_PARAMETER, "", "no command"};
    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    Handle out_r, out_w, err_r, err_w;
    if (!CreatePipe(&out_r.h, &out_w.h, &sa, 0) || !CreatePipe(&err_r.h, &err_w.h, &sa, 0)) {
        return {static_cast<int>(GetLastError()), "", "CreatePipe failed"};
    }
    SetHandleInformation(out_r.h, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_r.h, HANDLE_FLAG_INHERIT, 0);

    std::string cmdline;
    for (const auto& a : args) { if (!cmdline.empty()) cmdline += ' '; cmdline += quote_windows(a); }
    std::string block;
    for (const auto& [k, v] : env) { block += k + "=" + v; block.push_back('\0'); }
    block.push_back('\0');

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = out_w.h;
    si.hStdError = err_w.h;
    PROCESS_INFORMATION pi{};
    if (!CreateProcessA(args[0].c_str(), cmdline.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                        block.data(), nullptr, &si, &pi)) {
        DWORD e = GetLastError();
        return {static_cast<int>(e), "", "CreateProcess failed with error " + std::to_string(e)};
    }
    Handle process, thread;
    process.h = pi.hProcess;
    thread.h = pi.hThread;
    out_w.reset();
    err_w.reset();

    std::thread err_reader(drain, err_r.h, std::ref(result.err));
    drain(out_r.h, result.out);
    err_reader.join();

    WaitForSingleObject(process.h, INFINITE);
    DWORD code = 1;
    GetExitCodeProcess(process.h, &code);
    result.code = static_cast<int>(code);
    return result;
}

#endif
