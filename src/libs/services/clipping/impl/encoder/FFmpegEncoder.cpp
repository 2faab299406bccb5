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

#include "FFmpegEncoder.hpp"

#include <boost/asio/post.hpp>

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace clipper::clipping
{
#define LOG(severity, message) CLIPPER_LOG(ENCODER, severity, "[" << invocationId << "] - " << message)

    namespace
    {
        void addCommonArgs(core::IChildProcess::Args& args, const EncoderSettings& settings)
        {
            args.emplace_back(settings.ffmpegPath.string());

            // Make sure:
            // - we do not rely on input
            // - only errors end up in the diagnostic stream
            // - outputs left by a previous attempt are overwritten
            args.emplace_back("-nostdin");
            args.emplace_back("-hide_banner");
            args.emplace_back("-loglevel");
            args.emplace_back("error");
            args.emplace_back("-y");
        }

        void addEncodingArgs(core::IChildProcess::Args& args, const EncoderSettings& settings)
        {
            args.emplace_back("-c:v");
            args.emplace_back(settings.videoCodec);
            args.emplace_back("-c:a");
            args.emplace_back(settings.audioCodec);
            args.emplace_back("-preset");
            args.emplace_back(settings.preset);
            args.emplace_back("-crf");
            args.emplace_back(std::to_string(settings.crf));
        }
    } // namespace

    std::unique_ptr<IEncoder> createFFmpegEncoder(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const EncoderSettings& settings)
    {
        return std::make_unique<FFmpegEncoder>(ioContext, childProcessManager, settings);
    }

    core::IChildProcess::Args buildCutArgs(const EncoderSettings& settings, const std::filesystem::path& input, const Segment& segment, const std::filesystem::path& output)
    {
        core::IChildProcess::Args args;
        addCommonArgs(args, settings);

        args.emplace_back("-i");
        args.emplace_back(input.string());
        args.emplace_back("-ss");
        args.emplace_back(core::stringUtils::formatSeconds(segment.start));
        args.emplace_back("-to");
        args.emplace_back(core::stringUtils::formatSeconds(segment.end));

        addEncodingArgs(args, settings);

        // timestamps of the output must start at 0 to be concatenated later
        args.emplace_back("-avoid_negative_ts");
        args.emplace_back("make_zero");

        args.emplace_back(output.string());

        return args;
    }

    core::IChildProcess::Args buildConcatArgs(const EncoderSettings& settings, const std::filesystem::path& manifest, const std::filesystem::path& output)
    {
        core::IChildProcess::Args args;
        addCommonArgs(args, settings);

        args.emplace_back("-f");
        args.emplace_back("concat");
        // manifest holds absolute paths
        args.emplace_back("-safe");
        args.emplace_back("0");
        args.emplace_back("-i");
        args.emplace_back(manifest.string());

        addEncodingArgs(args, settings);

        args.emplace_back(output.string());

        return args;
    }

    FFmpegEncoder::FFmpegEncoder(boost::asio::io_context& ioContext, core::IChildProcessManager& childProcessManager, const EncoderSettings& settings)
        : _ioContext{ ioContext }
        , _childProcessManager{ childProcessManager }
        , _settings{ settings }
    {
        if (!std::filesystem::exists(_settings.ffmpegPath))
            CLIPPER_LOG(ENCODER, WARNING, "File " << _settings.ffmpegPath << " does not exist, encoding will fail!");

        CLIPPER_LOG(ENCODER, INFO, "Using " << _settings.ffmpegPath << ", video codec = '" << _settings.videoCodec << "', audio codec = '" << _settings.audioCodec << "', preset = '" << _settings.preset << "', crf = " << _settings.crf << ", timeout = " << _settings.timeout.count() << " seconds");
    }

    FFmpegEncoder::~FFmpegEncoder()
    {
        const std::scoped_lock lock{ _mutex };
        if (!_invocations.empty())
            CLIPPER_LOG(ENCODER, WARNING, "Destroying encoder with " << _invocations.size() << " pending invocation(s)");

        for (auto& [invocationId, invocation] : _invocations)
            invocation->timer.cancel();
    }

    void FFmpegEncoder::cut(const std::filesystem::path& input, const Segment& segment, const std::filesystem::path& output, OnDoneCallback callback)
    {
        run(buildCutArgs(_settings, input, segment, output), std::move(callback));
    }

    void FFmpegEncoder::concat(const std::filesystem::path& manifest, const std::filesystem::path& output, OnDoneCallback callback)
    {
        run(buildConcatArgs(_settings, manifest, output), std::move(callback));
    }

    void FFmpegEncoder::run(const core::IChildProcess::Args& args, OnDoneCallback callback)
    {
        const std::scoped_lock lock{ _mutex };

        const std::size_t invocationId{ _nextInvocationId++ };

        LOG(DEBUG, "Dumping args (" << args.size() << ")");
        for (const std::string& arg : args)
            LOG(DEBUG, "Arg = '" << arg << "'");

        auto invocation{ std::make_unique<Invocation>(_ioContext) };
        try
        {
            invocation->process = _childProcessManager.spawnChildProcess(_settings.ffmpegPath, args);
        }
        catch (const core::ChildProcessException& e)
        {
            LOG(ERROR, "Cannot execute " << _settings.ffmpegPath << ": " << e.what());

            // always report asynchronously
            boost::asio::post(_ioContext, [callback = std::move(callback), diagnostic = std::string{ e.what() }] {
                callback(EncodeOutcome{ .success = false, .exitCode = std::nullopt, .diagnostic = diagnostic });
            });
            return;
        }

        if (_settings.timeout.count() > 0)
        {
            invocation->timer.expires_after(_settings.timeout);
            invocation->timer.async_wait([this, invocationId](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted)
                    return;

                if (ec)
                {
                    LOG(ERROR, "Timeout timer failure: " << ec.message());
                    return;
                }

                const std::scoped_lock lock{ _mutex };
                auto it{ _invocations.find(invocationId) };
                if (it == std::end(_invocations))
                    return;

                LOG(ERROR, "Still running after " << _settings.timeout.count() << " seconds, killing it");
                it->second->timedOut = true;
                it->second->process->kill();
            });
        }

        core::IChildProcess& process{ *invocation->process };
        _invocations.emplace(invocationId, std::move(invocation));

        process.asyncWaitForExit([this, invocationId, callback = std::move(callback)](const core::IChildProcess::ExitStatus& status) {
            onInvocationDone(invocationId, status, callback);
        });
    }

    void FFmpegEncoder::onInvocationDone(std::size_t invocationId, const core::IChildProcess::ExitStatus& status, const OnDoneCallback& callback)
    {
        EncodeOutcome outcome{ .success = status.success(), .exitCode = status.exitCode, .diagnostic = status.diagnostic };

        // released once the callback is done, the process is no longer accessed by then
        std::unique_ptr<Invocation> invocation;
        {
            const std::scoped_lock lock{ _mutex };

            auto it{ _invocations.find(invocationId) };
            if (it != std::end(_invocations))
            {
                invocation = std::move(it->second);
                _invocations.erase(it);
            }
        }

        if (invocation)
        {
            invocation->timer.cancel();
            if (invocation->timedOut)
            {
                outcome.success = false;
                outcome.diagnostic = "Timeout after " + std::to_string(_settings.timeout.count()) + " seconds\n" + outcome.diagnostic;
            }
        }

        if (outcome.success)
            LOG(DEBUG, "Done");
        else if (outcome.exitCode)
            LOG(ERROR, "Failed with exit code " << *outcome.exitCode << ": " << outcome.diagnostic);
        else
            LOG(ERROR, "Terminated abnormally: " << outcome.diagnostic);

        callback(outcome);
    }

#undef LOG
} // namespace clipper::clipping
