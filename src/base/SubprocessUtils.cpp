#include "SubprocessUtils.hpp"

namespace pv {
string SubprocessUtils::SubprocessToStringInteractive(
    const string& command, const vector<string>& args, int* exitCode) {
  int link_client[2];
  char buf_client[4096];
  if (pipe(link_client) == -1) {
    throw std::runtime_error(string("pipe failed: ") + strerror(GetErrno()));
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
    }
    close(link_client[0]);
    close(link_client[1]);

    vector<char*> argsArray;
    argsArray.push_back(strdup(command.c_str()));
    for (const auto& arg : args) {
      argsArray.push_back(strdup(arg.c_str()));
    }
    argsArray.push_back(NULL);
    execvp(command.c_str(), &argsArray[0]);

    // Only reached when exec fails.  127 matches what a shell reports for a
    // missing command.
    _exit(127);
  } else if (pid > 0) {
    // parent process
    close(link_client[1]);
    string output;
    while (true) {
      int nbytes = read(link_client[0], buf_client, sizeof(buf_client));
      if (nbytes < 0 && GetErrno() == EINTR) {
        continue;
      }
      if (nbytes <= 0) {
        break;
      }
      output += string(buf_client, nbytes);
    }
    close(link_client[0]);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
      if (GetErrno() != EINTR) {
        throw std::runtime_error(string("waitpid failed: ") +
                                 strerror(GetErrno()));
      }
    }
    *exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    VLOG(1) << "Subprocess " << command << " exited with " << *exitCode;
    return output;
  } else {
    auto forkErrno = GetErrno();
    close(link_client[0]);
    close(link_client[1]);
    throw std::runtime_error(string("Failed to fork: ") + strerror(forkErrno));
  }
}
}  // namespace pv
