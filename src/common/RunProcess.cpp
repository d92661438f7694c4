//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Shell-based process runner for the end-to-end tests.
/// @details The argument vector is quoted into one command line for popen,
///          with redirections appended for stdin and stderr.  Compiled Per
///          programs that trap (division by zero) end by signal, which is
///          folded into the exit code the way POSIX shells do.

#include "common/RunProcess.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#    define PERC_POPEN _popen
#    define PERC_PCLOSE _pclose
#else
#    include <sys/wait.h>
#    define PERC_POPEN popen
#    define PERC_PCLOSE pclose
#endif

namespace perc::common
{

namespace
{

#ifdef _WIN32
/// @brief Quote for CommandLineToArgvW: backslashes double before a quote.
void appendQuoted(std::string &cmd, const std::string &arg)
{
    cmd += '"';
    size_t pending = 0;
    for (char ch : arg)
    {
        if (ch == '\\')
        {
            ++pending;
            continue;
        }
        cmd.append(ch == '"' ? pending * 2 + 1 : pending, '\\');
        pending = 0;
        cmd += ch;
    }
    cmd.append(pending * 2, '\\');
    cmd += '"';
}
#else
/// @brief Single-quote for /bin/sh; a quote inside becomes '\''.
void appendQuoted(std::string &cmd, const std::string &arg)
{
    cmd += '\'';
    for (char ch : arg)
    {
        if (ch == '\'')
            cmd += "'\\''";
        else
            cmd += ch;
    }
    cmd += '\'';
}
#endif

std::string commandLine(const std::vector<std::string> &argv, const RunOptions &options)
{
    std::string cmd;
    for (const auto &arg : argv)
    {
        if (!cmd.empty())
            cmd += ' ';
        appendQuoted(cmd, arg);
    }
    if (options.stdinPath)
    {
        cmd += " < ";
        appendQuoted(cmd, *options.stdinPath);
    }
    if (options.mergeStderr)
        cmd += " 2>&1";
    return cmd;
}

int decodeStatus(int status)
{
#ifdef _WIN32
    return status;
#else
    if (status == -1)
        return -1;
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return status;
#endif
}

struct PipeCloser
{
    int *status;

    void operator()(FILE *pipe) const
    {
        *status = PERC_PCLOSE(pipe);
    }
};

} // namespace

RunResult runProcess(const std::vector<std::string> &argv, const RunOptions &options)
{
    RunResult result;
    int status = -1;
    {
        const std::string cmd = commandLine(argv, options);
        std::unique_ptr<FILE, PipeCloser> pipe(PERC_POPEN(cmd.c_str(), "r"), PipeCloser{&status});
        if (!pipe)
        {
            result.exitCode = -1;
            return result;
        }

        char chunk[4096];
        for (size_t n; (n = std::fread(chunk, 1, sizeof(chunk), pipe.get())) != 0;)
            result.out.append(chunk, n);
    }
    result.exitCode = decodeStatus(status);
    return result;
}

} // namespace perc::common

#undef PERC_POPEN
#undef PERC_PCLOSE
