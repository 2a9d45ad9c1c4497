#include "child_process.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "common/errors.h"
#include "common/scoped_fd.h"
#include "tools/command_runner.h"

namespace MpathPr {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

ExitStatus Decode(int status) {
	ExitStatus out;
	if (WIFEXITED(status)) {
		out.exited = true;
		out.code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		out.signal = WTERMSIG(status);
	}
	return out;
}

} // namespace

std::string ExitStatus::Describe() const {
	if (exited) {
		return absl::StrCat("exit code ", code);
	}
	if (signal == 0) {
		return "exit status unavailable";
	}
	return absl::StrCat("killed by signal ", signal, " (", strsignal(signal), ")");
}

std::unique_ptr<ChildProcess> ChildProcess::Start(const std::vector<std::string>& argv) {
	if (argv.empty()) {
		throw BackgroundProcessFault("empty command line");
	}
	std::vector<char*> args;
	for (const auto& arg : argv) {
		args.push_back(const_cast<char*>(arg.c_str()));
	}
	args.push_back(nullptr);

	int err_pipe[2];
	if (pipe2(err_pipe, O_CLOEXEC) == -1) {
		throw BackgroundProcessFault(std::string("pipe failed: ") + strerror(errno));
	}
	ScopedFd err_read(err_pipe[0]);
	ScopedFd err_write(err_pipe[1]);

	pid_t pid = fork();
	if (pid == -1) {
		throw BackgroundProcessFault(std::string("fork failed: ") + strerror(errno));
	}
	if (pid == 0) {
		setpgid(0, 0);
		int in_fd = open("/dev/null", O_RDONLY);
		if (in_fd != -1) {
			dup2(in_fd, STDIN_FILENO);
		}
		execvp(args[0], args.data());
		int err = errno;
		ssize_t ignored = write(err_write.get(), &err, sizeof(err));
		(void)ignored;
		_exit(127);
	}
	// Also set from the parent so a signal sent right away hits the group
	setpgid(pid, pid);
	err_write.reset();

	int exec_errno = 0;
	ssize_t n;
	do {
		n = read(err_read.get(), &exec_errno, sizeof(exec_errno));
	} while (n == -1 && errno == EINTR);

	// Constructor is private, so no make_unique
	std::unique_ptr<ChildProcess> child(new ChildProcess(pid, argv[0]));
	if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
		child->Reap(true);
		throw BackgroundProcessFault("cannot execute " + argv[0] + ": " + strerror(exec_errno));
	}
	VLOG(1) << "Started " << JoinCommand(argv) << " (PID " << pid << ")";
	return child;
}

ChildProcess::~ChildProcess() {
	if (status_.has_value()) {
		return;
	}
	LOG(WARNING) << "Killing leftover " << name_ << " (PID " << pid_ << ")";
	kill(-pid_, SIGKILL);
	Reap(true);
}

bool ChildProcess::Reap(bool block) {
	if (status_.has_value()) {
		return true;
	}
	int status = 0;
	while (true) {
		pid_t r = waitpid(pid_, &status, block ? 0 : WNOHANG);
		if (r == pid_) {
			status_ = Decode(status);
			return true;
		}
		if (r == 0) {
			return false;
		}
		if (errno != EINTR) {
			// ECHILD: somebody else reaped it; nothing left to supervise
			LOG(ERROR) << "waitpid(" << pid_ << ") failed: " << strerror(errno);
			status_ = ExitStatus{false, 0, 0};
			return true;
		}
	}
}

bool ChildProcess::IsAlive() {
	return !Reap(false);
}

ExitStatus ChildProcess::Stop(std::chrono::milliseconds timeout) {
	if (!Reap(false)) {
		if (kill(-pid_, SIGTERM) == -1 && errno != ESRCH) {
			LOG(ERROR) << "Sending SIGTERM to " << name_ << " failed: " << strerror(errno);
		}
		auto deadline = std::chrono::steady_clock::now() + timeout;
		while (!Reap(false)) {
			if (std::chrono::steady_clock::now() >= deadline) {
				kill(-pid_, SIGKILL);
				Reap(true);
				throw BackgroundProcessFault(absl::StrCat(name_, " (PID ", pid_,
					") did not exit within ", timeout.count(), " ms of SIGTERM"));
			}
			std::this_thread::sleep_for(kPollInterval);
		}
	}
	return *status_;
}

ProcessLauncher DefaultLauncher() {
	return [](const std::vector<std::string>& argv) -> std::unique_ptr<IChildProcess> {
		return ChildProcess::Start(argv);
	};
}

} // namespace MpathPr
