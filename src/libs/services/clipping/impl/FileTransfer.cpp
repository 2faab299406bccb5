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

#include "FileTransfer.hpp"

#include <fstream>
#include <system_error>
#include <vector>

#include "core/ILogger.hpp"
#include "services/clipping/Exception.hpp"

namespace clipper::clipping
{
    namespace
    {
        void removePartialFile(const std::filesystem::path& path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
                CLIPPER_LOG(UTILS, ERROR, "Cannot remove partial file " << path << ": " << ec.message());
        }
    } // namespace

    std::uint64_t copyFileToStream(const std::filesystem::path& path, std::ostream& output)
    {
        std::ifstream ifs{ path, std::ios::in | std::ios::binary };
        if (!ifs)
        {
            CLIPPER_LOG(UTILS, ERROR, "Cannot open file stream for " << path);
            throw Exception{ "Cannot open file" };
        }

        std::vector<char> buffer(transferChunkSize);
        std::uint64_t totalSize{};
        while (ifs)
        {
            ifs.read(buffer.data(), buffer.size());
            const std::uint64_t actualPieceSize{ static_cast<std::uint64_t>(ifs.gcount()) };
            if (actualPieceSize == 0)
                break;

            output.write(buffer.data(), actualPieceSize);
            if (!output)
            {
                CLIPPER_LOG(UTILS, WARNING, "Write failed after " << totalSize << " bytes of " << path);
                throw Exception{ "Write failed" };
            }

            totalSize += actualPieceSize;
        }

        if (ifs.bad())
        {
            CLIPPER_LOG(UTILS, ERROR, "Error reading from " << path);
            throw Exception{ "Read failed" };
        }

        CLIPPER_LOG(UTILS, DEBUG, "Written " << totalSize << " bytes from " << path);
        return totalSize;
    }

    std::optional<std::uint64_t> copyStreamToFile(std::istream& input, const std::filesystem::path& path, std::uint64_t maxSize)
    {
        std::ofstream ofs{ path, std::ios::out | std::ios::binary | std::ios::trunc };
        if (!ofs)
        {
            CLIPPER_LOG(UTILS, ERROR, "Cannot create " << path);
            throw Exception{ "Cannot create file" };
        }

        std::vector<char> buffer(transferChunkSize);
        std::uint64_t totalSize{};
        while (input)
        {
            input.read(buffer.data(), buffer.size());
            const std::uint64_t actualPieceSize{ static_cast<std::uint64_t>(input.gcount()) };
            if (actualPieceSize == 0)
                break;

            totalSize += actualPieceSize;
            if (totalSize > maxSize)
            {
                CLIPPER_LOG(UTILS, DEBUG, "Input exceeds " << maxSize << " bytes, discarding " << path);
                ofs.close();
                removePartialFile(path);
                return std::nullopt;
            }

            ofs.write(buffer.data(), actualPieceSize);
            if (!ofs)
            {
                CLIPPER_LOG(UTILS, ERROR, "Write failed to " << path);
                ofs.close();
                removePartialFile(path);
                throw Exception{ "Write failed" };
            }
        }

        if (input.bad())
        {
            CLIPPER_LOG(UTILS, ERROR, "Error reading input for " << path);
            ofs.close();
            removePartialFile(path);
            throw Exception{ "Read failed" };
        }

        CLIPPER_LOG(UTILS, DEBUG, "Stored " << totalSize << " bytes in " << path);
        return totalSize;
    }
} // namespace clipper::clipping
