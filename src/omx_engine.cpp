#include "vidsync/engine.h"

#include "logging.h"
#include "net.h"

#include <cerrno>
#include <cstring>
#include <iterator>
#include <map>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vidsync {
namespace {

// Player arguments following "-o <audio>" and preceding the media path.
const char* const kPlayerArgs[] = {"--no-osd", "--aspect-mode", "letterbox"};

// Single-byte keyboard commands read by the player from stdin.
constexpr char kTogglePauseKey = 'p';
constexpr char kQuitKey = 'q';

// Recreate the control FIFO so a stale or corrupted one is never reused.
bool RecreateFifo(const std::string& path, std::string* error) {
  if (::unlink(path.c_str()) < 0 && errno != ENOENT) {
    *error = internal::ErrnoString(("unlink(" + path + ")").c_str());
    return false;
  }
  if (::mkfifo(path.c_str(), 0600) < 0) {
    *error = internal::ErrnoString(("mkfifo(" + path + ")").c_str());
    return false;
  }
  return true;
}

// Reap a child, retrying on EINTR. Returns false if it was already reaped.
bool WaitForChild(pid_t pid) {
  while (true) {
    const pid_t result = ::waitpid(pid, nullptr, 0);
    if (result == pid) {
      return true;
    }
    if (result < 0 && errno == EINTR) {
      continue;
    }
    return false;
  }
}

}  // namespace

struct OmxPlayerEngine::Impl {
  struct Process {
    pid_t pid = -1;
    internal::ScopedFd control;
    bool exited = false;
  };

  explicit Impl(const DeviceConfig& config)
      : player_binary(config.player_binary),
        fifo_path(config.control_fifo_path),
        logger(config) {}

  ~Impl() {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : sessions) {
      KillLocked(&entry.second);
    }
    sessions.clear();
  }

  std::optional<SessionHandle> Launch(const std::string& media_path,
                                      AudioOutput audio, std::string* error) {
    std::string message;
    auto fail = [&](const std::string& text) -> std::optional<SessionHandle> {
      if (error) {
        *error = text;
      }
      return std::nullopt;
    };

    if (!RecreateFifo(fifo_path, &message)) {
      return fail(message);
    }
    // Opening read/write keeps the FIFO from blocking and from seeing EOF
    // while no writer is attached.
    internal::ScopedFd control(::open(fifo_path.c_str(), O_RDWR | O_CLOEXEC));
    if (!control.valid()) {
      return fail(internal::ErrnoString(("open(" + fifo_path + ")").c_str()));
    }

    std::vector<std::string> args = {player_binary, "-o", AudioOutputName(audio)};
    args.insert(args.end(), std::begin(kPlayerArgs), std::end(kPlayerArgs));
    args.push_back(media_path);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Exec failures are reported by the child through this pipe; a clean
    // exec closes it and the parent reads EOF.
    int status_pipe[2] = {-1, -1};
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
      return fail(internal::ErrnoString("pipe2()"));
    }
    internal::ScopedFd status_read(status_pipe[0]);
    internal::ScopedFd status_write(status_pipe[1]);

    std::string command_line;
    for (const auto& arg : args) {
      command_line += (command_line.empty() ? "" : " ") + arg;
    }
    logger.Info("Starting: " + command_line);

    const pid_t pid = ::fork();
    if (pid < 0) {
      return fail(internal::ErrnoString("fork()"));
    }
    if (pid == 0) {
      // Child: own process group so the whole tree can be killed at once.
      ::setsid();
      ::dup2(control.get(), STDIN_FILENO);
      const int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
      }
      ::execvp(argv[0], argv.data());
      const int exec_errno = errno;
      ssize_t ignored = ::write(status_write.get(), &exec_errno, sizeof(exec_errno));
      (void)ignored;
      ::_exit(127);
    }

    status_write.reset();
    int child_errno = 0;
    ssize_t bytes = 0;
    do {
      bytes = ::read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (bytes < 0 && errno == EINTR);
    if (bytes == static_cast<ssize_t>(sizeof(child_errno))) {
      WaitForChild(pid);
      return fail("exec " + player_binary + " failed: " + std::strerror(child_errno));
    }

    std::lock_guard<std::mutex> lock(mutex);
    Process& process = sessions[pid];
    process.pid = pid;
    process.control = std::move(control);
    process.exited = false;
    return SessionHandle{static_cast<int64_t>(pid)};
  }

  bool SendControl(const SessionHandle& handle, ControlInstruction instruction) {
    std::lock_guard<std::mutex> lock(mutex);
    Process* process = FindLocked(handle);
    if (!process || !process->control.valid()) {
      return false;
    }
    const char key =
        instruction == ControlInstruction::kQuit ? kQuitKey : kTogglePauseKey;
    ssize_t written = 0;
    do {
      written = ::write(process->control.get(), &key, 1);
    } while (written < 0 && errno == EINTR);
    if (written != 1) {
      logger.Error(internal::ErrnoString("write(control fifo)"));
      return false;
    }
    return true;
  }

  bool IsAlive(const SessionHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex);
    Process* process = FindLocked(handle);
    if (!process) {
      return false;
    }
    return PollLocked(process);
  }

  void ForceTerminate(const SessionHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex);
    Process* process = FindLocked(handle);
    if (process) {
      KillLocked(process);
    }
  }

  void Release(const SessionHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(handle.id);
    if (it == sessions.end()) {
      return;
    }
    if (PollLocked(&it->second)) {
      logger.Warning("Releasing a running player, killing it");
      KillLocked(&it->second);
    }
    sessions.erase(it);
  }

  Process* FindLocked(const SessionHandle& handle) {
    auto it = sessions.find(handle.id);
    return it == sessions.end() ? nullptr : &it->second;
  }

  // Non-blocking reap; returns true while the process is still running.
  bool PollLocked(Process* process) {
    if (process->exited) {
      return false;
    }
    const pid_t result = ::waitpid(process->pid, nullptr, WNOHANG);
    if (result == 0) {
      return true;
    }
    process->exited = true;
    return false;
  }

  void KillLocked(Process* process) {
    if (process->exited) {
      return;
    }
    if (::killpg(process->pid, SIGKILL) < 0) {
      ::kill(process->pid, SIGKILL);
    }
    WaitForChild(process->pid);
    process->exited = true;
  }

  std::string player_binary;
  std::string fifo_path;
  internal::Logger logger;
  std::mutex mutex;
  std::map<int64_t, Process> sessions;
};

OmxPlayerEngine::OmxPlayerEngine(const DeviceConfig& config)
    : impl_(new Impl(config)) {}

OmxPlayerEngine::~OmxPlayerEngine() = default;

std::optional<SessionHandle> OmxPlayerEngine::Launch(const std::string& media_path,
                                                     AudioOutput audio,
                                                     std::string* error) {
  return impl_->Launch(media_path, audio, error);
}

bool OmxPlayerEngine::SendControl(const SessionHandle& handle,
                                  ControlInstruction instruction) {
  return impl_->SendControl(handle, instruction);
}

bool OmxPlayerEngine::IsAlive(const SessionHandle& handle) {
  return impl_->IsAlive(handle);
}

void OmxPlayerEngine::ForceTerminate(const SessionHandle& handle) {
  impl_->ForceTerminate(handle);
}

void OmxPlayerEngine::Release(const SessionHandle& handle) {
  impl_->Release(handle);
}

}  // namespace vidsync
