/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Clipper.
 *
 * Clipper is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Clipper is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Clipper.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <system_error>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "core/ILogger.hpp"

namespace clipper::core
{
    namespace
    {
        class SystemException : public ChildProcessException
        {
        public:
            SystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            SystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        std::mutex& getSpawnMutex()
        {
            static std::mutex mutex;
            return mutex;
        }
    } // namespace

    ChildProcess::ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args)
        : _ioContext{ ioContext }
        , _childStderr{ _ioContext }
    {
        // make sure only one thread is executing this part of code
        const std::scoped_lock lock{ getSpawnMutex() };

        int pipefd[2];

        // Use 'pipe' instead of 'pipe2', more portable
        if (pipe(pipefd) == -1)
            throw SystemException{ std::error_code{ errno, std::generic_category() }, "pipe failed!" };

        // Only set O_NONBLOCK on read end, the child expects a blocking stderr
        if (fcntl(pipefd[0], F_SETFL, O_NONBLOCK) == -1)
        {
            const std::error_code ec{ errno, std::generic_category() };
            close(pipefd[0]);
            close(pipefd[1]);
            throw SystemException{ ec, "fcntl failed to set O_NONBLOCK!" };
        }

        // Prepare args before forking, only async-signal-safe calls are allowed in the child
        std::vector<const char*> execArgs;
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
        execArgs.push_back(nullptr);
        const std::string execPath{ path.string() };

        const int res{ fork() };
        if (res == -1)
        {
            const std::error_code ec{ errno, std::generic_category() };
            close(pipefd[0]);
            close(pipefd[1]);
            throw SystemException{ ec, "fork failed!" };
        }

        if (res == 0) // CHILD
        {
            // Never close stdin/out/err, most programs expect these to exist;
            // rather connect them to /dev/null if unwanted
            const int nullFd{ open("/dev/null", O_RDWR) };
            if (nullFd != -1)
            {
                dup2(nullFd, STDIN_FILENO);
                dup2(nullFd, STDOUT_FILENO);
                close(nullFd);
            }

            // Replace stderr with pipe write: this is where diagnostics go
            if (dup2(pipefd[1], STDERR_FILENO) == -1)
                _exit(-1);
            close(pipefd[0]);
            close(pipefd[1]);

            execv(execPath.c_str(), const_cast<char* const*>(execArgs.data()));
            _exit(-1);
        }

        // PARENT
        close(pipefd[1]);
        _childPID = res;
        {
            boost::system::error_code assignError;
            _childStderr.assign(pipefd[0], assignError);
            if (assignError)
            {
                close(pipefd[0]);
                kill();
                wait(true);
                throw SystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
            }
        }

        CLIPPER_LOG(CHILDPROCESS, DEBUG, "Spawned " << path << ", pid = " << _childPID);
    }

    ChildProcess::~ChildProcess()
    {
        CLIPPER_LOG(CHILDPROCESS, DEBUG, "Closing child process...");
        if (_childStderr.is_open())
        {
            boost::system::error_code closeError;
            _childStderr.close(closeError);
            if (closeError)
                CLIPPER_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
        }

        if (!_waited)
        {
            if (!_finished)
                kill();

            try
            {
                wait(true);
            }
            catch (const ChildProcessException& e)
            {
                CLIPPER_LOG(CHILDPROCESS, ERROR, "Cannot reap child process: " << e.what());
            }
        }
    }

    void ChildProcess::kill()
    {
        const std::scoped_lock lock{ _stateMutex };

        // process may already have been reaped, its pid may have been reused
        if (_waited)
            return;

        CLIPPER_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        if (::kill(_childPID, SIGKILL) == -1)
        {
            const int err{ errno };
            CLIPPER_LOG(CHILDPROCESS, DEBUG, "Kill failed: " << (std::error_code{ err, std::generic_category() }.message()));
            return;
        }

        _killed = true;
    }

    bool ChildProcess::wait(bool block)
    {
        int wstatus{};
        const pid_t pid{ waitpid(_childPID, &wstatus, block ? 0 : WNOHANG) };

        if (pid == -1)
            throw SystemException{ std::error_code{ errno, std::generic_category() }, "waitpid failed!" };
        if (pid == 0)
            return false;

        const std::scoped_lock lock{ _stateMutex };
        if (WIFEXITED(wstatus))
        {
            _exitCode = WEXITSTATUS(wstatus);
            CLIPPER_LOG(CHILDPROCESS, DEBUG, "Exit code = " << *_exitCode);
        }
        else if (WIFSIGNALED(wstatus))
        {
            CLIPPER_LOG(CHILDPROCESS, DEBUG, "Terminated by signal " << WTERMSIG(wstatus));
        }

        _waited = true;
        return true;
    }

    void ChildProcess::asyncWaitForExit(ExitCallback callback)
    {
        _exitCallback = std::move(callback);
        asyncReadStderr();
    }

    void ChildProcess::asyncReadStderr()
    {
        _childStderr.async_read_some(boost::asio::buffer(_readBuffer), [this](const boost::system::error_code& error, std::size_t bytesTransferred) {
            if (error == boost::asio::error::operation_aborted)
            {
                // forbidden to read any captured param here as the ChildProcess instance may already have been destroyed
                return;
            }

            appendDiagnostic(bytesTransferred);
            if (!error)
            {
                asyncReadStderr();
                return;
            }

            if (error != boost::asio::error::eof)
                CLIPPER_LOG(CHILDPROCESS, ERROR, "Read from child process " << _childPID << " failed: " << error.message());

            _finished = true;

            boost::system::error_code closeError;
            _childStderr.close(closeError);

            try
            {
                wait(true);
            }
            catch (const ChildProcessException& e)
            {
                CLIPPER_LOG(CHILDPROCESS, ERROR, "Cannot reap child process: " << e.what());
            }

            const ExitStatus status{ _exitCode, _killed, _diagnostic };
            ExitCallback exitCallback{ std::move(_exitCallback) };
            exitCallback(status);
        });
    }

    void ChildProcess::appendDiagnostic(std::size_t byteCount)
    {
        _diagnostic.append(_readBuffer.data(), byteCount);

        // only keep the tail, this is where the actual error usually is
        if (_diagnostic.size() > _maxDiagnosticSize)
            _diagnostic.erase(0, _diagnostic.size() - _maxDiagnosticSize);
    }

    bool ChildProcess::finished() const
    {
        return _finished;
    }
} // namespace clipper::core
