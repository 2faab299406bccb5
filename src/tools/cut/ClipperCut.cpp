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

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <stdlib.h>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "core/StreamLogger.hpp"
#include "core/String.hpp"
#include "services/clipping/IClippingService.hpp"

namespace clipper
{
    namespace
    {
        // "<start>:<end>", in seconds
        std::optional<std::pair<double, double>> parseSegment(std::string_view str)
        {
            const std::vector<std::string_view> bounds{ core::stringUtils::splitString(str, ':') };
            if (bounds.size() != 2)
                return std::nullopt;

            const std::optional<double> start{ core::stringUtils::readAs<double>(core::stringUtils::stringTrim(bounds[0])) };
            const std::optional<double> end{ core::stringUtils::readAs<double>(core::stringUtils::stringTrim(bounds[1])) };
            if (!start || !end)
                return std::nullopt;

            return std::make_pair(*start, *end);
        }

        clipping::ProcessingResult waitForProcessing(clipping::IClippingService& service, std::string_view filename, const std::vector<clipping::Segment>& segments, std::string_view sessionId)
        {
            std::promise<clipping::ProcessingResult> promise;
            std::future<clipping::ProcessingResult> future{ promise.get_future() };

            service.submitSegments(filename, segments, sessionId, [&](const clipping::ProcessingResult& result) {
                promise.set_value(result);
            });

            return future.get();
        }
    } // namespace
} // namespace clipper

int main(int argc, char* argv[])
{
    try
    {
        using namespace clipper;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };

        // clang-format off
        desc.add_options()
            ("help,h", "print usage message")
            ("conf,c", po::value<std::string>(), "Clipper config file")
            ("input,i", po::value<std::string>()->required(), "Source video file")
            ("segment,s", po::value<std::vector<std::string>>()->required(), "Segment to keep, as <start>:<end> in seconds (can be repeated)")
            ("output,o", po::value<std::string>()->required(), "Output file")
            ("working-dir,w", po::value<std::string>(), "Working directory, overrides the config file value")
            ("verbose,v", "print debug messages");
        // clang-format on

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }
        po::notify(vm);

        core::Service<core::IConfig> config;
        if (vm.count("conf"))
            config.assign(core::createConfig(vm["conf"].as<std::string>()));

        // log to stderr, unless the config file says otherwise
        core::Service<core::logging::ILogger> logger;
        if (config.exists() && !vm.count("verbose"))
            logger.assign(core::logging::createLogger(core::logging::parseSeverity(config->getString("log-min-severity", "info")), config->getPath("log-file", "")));
        else
            logger.assign(std::make_unique<core::logging::StreamLogger>(std::cerr, vm.count("verbose") ? core::logging::Severity::DEBUG : core::logging::Severity::INFO));

        clipping::Settings settings;
        clipping::EncoderSettings encoderSettings;
        unsigned long threadCount{ 2 };
        if (config.exists())
        {
            settings = clipping::readSettings(*config);
            encoderSettings = clipping::readEncoderSettings(*config);
            threadCount = config->getULong("io-thread-count", threadCount);
        }
        else
            settings.workingDirectory = std::filesystem::temp_directory_path() / "clipper";

        if (vm.count("working-dir"))
            settings.workingDirectory = vm["working-dir"].as<std::string>();

        // single run: no periodic collection
        settings.sweepInterval = std::chrono::seconds{ 0 };

        boost::asio::io_context ioContext;
        core::IOContextRunner ioContextRunner{ ioContext, std::max<unsigned long>(1, threadCount), "Clipper" };

        auto childProcessManager{ core::createChildProcessManager(ioContext) };
        auto encoder{ clipping::createFFmpegEncoder(ioContext, *childProcessManager, encoderSettings) };
        auto service{ clipping::createClippingService(ioContext, settings, *encoder) };

        const std::filesystem::path inputPath{ vm["input"].as<std::string>() };
        std::ifstream input{ inputPath, std::ios::in | std::ios::binary };
        if (!input)
        {
            std::cerr << "Cannot open " << inputPath << std::endl;
            return EXIT_FAILURE;
        }

        const clipping::UploadResult upload{ service->recordUpload(input, inputPath.filename().string(), "") };
        input.close();

        // overlapping segments are merged the same way an interactive client would see them
        for (const std::string& segmentStr : vm["segment"].as<std::vector<std::string>>())
        {
            const auto bounds{ parseSegment(segmentStr) };
            if (!bounds)
            {
                std::cerr << "Invalid segment '" << segmentStr << "'" << std::endl;
                service->cleanup(upload.sessionId);
                return EXIT_FAILURE;
            }

            if (service->proposeSegment(upload.sessionId, bounds->first, bounds->second) == clipping::MergeOutcome::Rejected)
                std::cerr << "Ignoring degenerate segment '" << segmentStr << "'" << std::endl;
        }

        const std::vector<clipping::Segment> segments{ service->getSegments(upload.sessionId) };
        if (segments.empty())
        {
            std::cerr << "No valid segment to keep" << std::endl;
            service->cleanup(upload.sessionId);
            return EXIT_FAILURE;
        }

        for (const clipping::Segment& segment : segments)
            CLIPPER_LOG(MAIN, INFO, "Keeping segment " << segment);

        const clipping::ProcessingResult result{ waitForProcessing(*service, upload.filename, segments, upload.sessionId) };
        if (!result.success())
        {
            std::cerr << clipping::processingFailedMessage << ": " << *result.failure << std::endl;
            service->cleanup(upload.sessionId);
            return EXIT_FAILURE;
        }

        const std::filesystem::path outputPath{ vm["output"].as<std::string>() };
        std::ofstream output{ outputPath, std::ios::out | std::ios::binary | std::ios::trunc };
        if (!output)
        {
            std::cerr << "Cannot create " << outputPath << std::endl;
            service->cleanup(upload.sessionId);
            return EXIT_FAILURE;
        }

        const clipping::RedeemResult redeemResult{ service->redeemToken(*result.downloadToken, output) };
        output.close();
        service->cleanup(upload.sessionId);

        std::cout << "Written " << redeemResult.byteCount << " bytes to " << outputPath << " (suggested name '" << redeemResult.displayName << "')" << std::endl;
    }
    catch (std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
