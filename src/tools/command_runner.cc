#include "command_runner.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "common/errors.h"
#include "common/scoped_fd.h"

namespace MpathPr {

namespace {

std::vector<char*> MakeArgv(const std::vector<std::string>& argv) {
	std::vector<char*> out;
	out.reserve(argv.size() + 1);
	for (const auto& arg : argv) {
		out.push_back(const_cast<char*>(arg.c_str()));
	}
	out.push_back(nullptr);
	return out;
}

int DecodeWaitStatus(int status) {
	if (WIFEXITED(status)) {
		return WEXITSTATUS(status);
	}
	if (WIFSIGNALED(status)) {
		return 128 + WTERMSIG(status);
	}
	return -1;
}

// Quote for the remote shell that ssh hands the command line to
std::string ShellQuote(const std::string& arg) {
	return "'" + absl::StrReplaceAll(arg, {{"'", "'\\''"}}) + "'";
}

} // namespace

CommandResult LocalCommandRunner::Run(const std::vector<std::string>& argv) {
	if (argv.empty()) {
		throw ToolInvocationFailure("empty command line");
	}
	VLOG(2) << "Running: " << JoinCommand(argv);

	int out_pipe[2];
	int err_pipe[2];
	if (pipe2(out_pipe, O_CLOEXEC) == -1) {
		throw ToolInvocationFailure(std::string("pipe failed: ") + strerror(errno));
	}
	ScopedFd out_read(out_pipe[0]);
	ScopedFd out_write(out_pipe[1]);
	// Reports exec failure to the parent; closed by a successful exec
	if (pipe2(err_pipe, O_CLOEXEC) == -1) {
		throw ToolInvocationFailure(std::string("pipe failed: ") + strerror(errno));
	}
	ScopedFd err_read(err_pipe[0]);
	ScopedFd err_write(err_pipe[1]);

	auto args = MakeArgv(argv);
	pid_t pid = fork();
	if (pid == -1) {
		throw ToolInvocationFailure(std::string("fork failed: ") + strerror(errno));
	}
	if (pid == 0) {
		// Child: only async-signal-safe calls from here on.
		// Own process group: a terminal ^C must not cut a PR command short.
		if (options_.own_process_group) {
			setpgid(0, 0);
		}
		// A background group reading the terminal would be stopped by SIGTTIN
		int in_fd = open("/dev/null", O_RDONLY);
		if (in_fd != -1) {
			dup2(in_fd, STDIN_FILENO);
		}
		dup2(out_write.get(), STDOUT_FILENO);
		if (options_.discard_stderr) {
			int null_fd = open("/dev/null", O_WRONLY);
			if (null_fd != -1) {
				dup2(null_fd, STDERR_FILENO);
			}
		}
		execvp(args[0], args.data());
		int err = errno;
		ssize_t ignored = write(err_write.get(), &err, sizeof(err));
		(void)ignored;
		_exit(127);
	}

	out_write.reset();
	err_write.reset();

	CommandResult result;
	char buf[4096];
	while (true) {
		ssize_t n = read(out_read.get(), buf, sizeof(buf));
		if (n > 0) {
			result.output.append(buf, static_cast<size_t>(n));
		} else if (n == 0) {
			break;
		} else if (errno != EINTR) {
			LOG(WARNING) << "Reading output of " << argv[0] << " failed: " << strerror(errno);
			break;
		}
	}

	int exec_errno = 0;
	ssize_t n;
	do {
		n = read(err_read.get(), &exec_errno, sizeof(exec_errno));
	} while (n == -1 && errno == EINTR);

	int status = 0;
	while (waitpid(pid, &status, 0) == -1) {
		if (errno != EINTR) {
			throw ToolInvocationFailure("waitpid for " + argv[0] + " failed: " + strerror(errno));
		}
	}

	if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
		throw ToolInvocationFailure("cannot execute " + argv[0] + ": " + strerror(exec_errno));
	}

	result.exit_status = DecodeWaitStatus(status);
	VLOG(3) << argv[0] << " exited " << result.exit_status << ", output:\n" << result.output;
	return result;
}

RemoteCommandRunner::RemoteCommandRunner(std::shared_ptr<ICommandRunner> transport,
		std::string ssh, std::string host)
	: transport_(std::move(transport)), ssh_(std::move(ssh)), host_(std::move(host)) {}

CommandResult RemoteCommandRunner::Run(const std::vector<std::string>& argv) {
	std::vector<std::string> quoted;
	quoted.reserve(argv.size());
	for (const auto& arg : argv) {
		quoted.push_back(ShellQuote(arg));
	}
	std::vector<std::string> ssh_argv = {ssh_, "-n", "-o", "BatchMode=yes", host_, "--",
		absl::StrJoin(quoted, " ")};
	CommandResult result = transport_->Run(ssh_argv);
	if (result.exit_status == 255) {
		// ssh reserves 255 for its own failures
		throw ToolInvocationFailure("ssh to " + host_ + " failed running " + JoinCommand(argv));
	}
	return result;
}

std::string JoinCommand(const std::vector<std::string>& argv) {
	return absl::StrJoin(argv, " ");
}

bool ProgramExists(const std::string& program) {
	auto executable = [](const std::string& path) {
		struct stat st;
		return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
	};
	if (program.find('/') != std::string::npos) {
		return executable(program);
	}
	const char* path_env = std::getenv("PATH");
	if (path_env == nullptr) {
		return false;
	}
	for (absl::string_view dir : absl::StrSplit(path_env, ':', absl::SkipEmpty())) {
		if (executable(std::string(dir) + "/" + program)) {
			return true;
		}
	}
	return false;
}

} // namespace MpathPr
