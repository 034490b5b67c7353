/**@file Subprocess.cpp
 * @date 20261018 09:12:40 */

#include "Subprocess.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <logging.hpp>
#include <pcmsink.h>

namespace pcmsink {

const size_t Subprocess::MAX_OUTPUT;

namespace {

typedef std::chrono::steady_clock SteadyClock;

const long GRACE_MS = 1000;

/// runs in the forked child, only async-signal-safe calls here
void
exec_child(char* const argv[], int outfd)
{
	sigset_t none;
	sigemptyset(&none);
	sigprocmask(SIG_SETMASK, &none, NULL);
	int nullfd = open("/dev/null", O_RDONLY);
	if (nullfd != -1)
	{
		dup2(nullfd, STDIN_FILENO);
		close(nullfd);
	}
	dup2(outfd, STDOUT_FILENO);
	dup2(outfd, STDERR_FILENO);
	close(outfd);
	execvp(argv[0], argv);
	_exit(127);
}

long
ms_left(const SteadyClock::time_point& deadline)
{
	long rs = std::chrono::duration_cast<std::chrono::milliseconds>(
		deadline - SteadyClock::now()).count();
	return rs > 0 ? rs : 0;
}

bool
reap(pid_t pid, int& status, bool block)
{
	for (;;)
	{
		pid_t rs = waitpid(pid, &status, block ? 0 : WNOHANG);
		if (rs == pid)
			return true;
		if (rs == -1 && errno == EINTR)
			continue;
		return false;
	}
}

void
append_bounded(std::string& out, const char* buf, size_t n)
{
	size_t room = Subprocess::MAX_OUTPUT - out.size();
	out.append(buf, n < room ? n : room);
}

/**@brief Read what is already in the pipe
 *
 * Does not wait for EOF: a grandchild may still hold the write end.*/
void
drain(int fd, std::string& out)
{
	char buf[4096];
	for (;;)
	{
		struct pollfd pfd = {fd, POLLIN, 0};
		int prs = poll(&pfd, 1, 0);
		if (prs == -1 && errno == EINTR)
			continue;
		if (prs <= 0)
			return;
		ssize_t n = read(fd, buf, sizeof(buf));
		if (n > 0)
			append_bounded(out, buf, (size_t)n);
		else if (n == -1 && errno == EINTR)
			continue;
		else
			return;
	}
}

/// SIGTERM, grace period, SIGKILL
void
terminate(pid_t pid, int& status)
{
	kill(pid, SIGTERM);
	SteadyClock::time_point grace = SteadyClock::now()
		+ std::chrono::milliseconds(GRACE_MS);
	while (ms_left(grace) > 0)
	{
		if (reap(pid, status, false))
			return;
		usleep(10000);
	}
	kill(pid, SIGKILL);
	reap(pid, status, true);
}

} // namespace

Subprocess::Result
Subprocess::Run(const std::vector<std::string>& argv, unsigned timeout_sec)
{
	Result rs;
	if (argv.empty())
		return rs;
	std::vector<char*> args;
	args.reserve(argv.size() + 1);
	for (size_t i = 0; i < argv.size(); ++i)
		args.push_back(const_cast<char*>(argv[i].c_str()));
	args.push_back(NULL);

	int fds[2];
	if (pipe2(fds, O_CLOEXEC) == -1)
	{
		LOG(ERROR) << _("Subprocess: error creating pipe.")
		           << _(" Message: ") << strerror(errno);
		return rs;
	}
	pid_t pid = fork();
	if (pid == -1)
	{
		LOG(ERROR) << _("Subprocess: fork failed.")
		           << _(" Message: ") << strerror(errno);
		close(fds[0]);
		close(fds[1]);
		return rs;
	}
	if (pid == 0)
	{
		close(fds[0]);
		exec_child(&args[0], fds[1]);
	}
	close(fds[1]);
	rs.started = true;
	VLOG(2) << "Subprocess: started " << argv[0] << " (pid " << pid << ")";

	SteadyClock::time_point deadline = SteadyClock::now()
		+ std::chrono::seconds(timeout_sec);
	int status = 0;
	bool exited = false;
	bool eof = false;
	char buf[4096];
	while (!exited)
	{
		long left = ms_left(deadline);
		if (left == 0)
		{
			LOG(WARNING) << _("Subprocess: ") << argv[0]
			             << _(" exceeded ") << timeout_sec
			             << _(" seconds, terminating");
			terminate(pid, status);
			rs.timed_out = true;
			exited = true;
			break;
		}
		if (eof)
		{
			if (reap(pid, status, false))
			{
				exited = true;
				break;
			}
			usleep(10000);
			continue;
		}
		struct pollfd pfd = {fds[0], POLLIN, 0};
		int prs = poll(&pfd, 1, left < 100 ? (int)left : 100);
		if (prs == -1 && errno != EINTR)
		{
			LOG(ERROR) << _("Subprocess: poll failed.")
			           << _(" Message: ") << strerror(errno);
			eof = true;
			continue;
		}
		if (prs <= 0)
		{
			if (reap(pid, status, false))
				exited = true;
			continue;
		}
		ssize_t n = read(fds[0], buf, sizeof(buf));
		if (n > 0)
			append_bounded(rs.output, buf, (size_t)n);
		else if (n == 0 || (errno != EINTR && errno != EAGAIN))
		{
			eof = true;
		}
	}
	if (!eof)
		drain(fds[0], rs.output);
	close(fds[0]);
	if (WIFEXITED(status))
		rs.exit_code = WEXITSTATUS(status);
	else if (WIFSIGNALED(status))
		rs.signal = WTERMSIG(status);
	VLOG(2) << "Subprocess: " << argv[0] << " finished, code "
	        << rs.exit_code << ", signal " << rs.signal;
	return rs;
}

} // namespace
