// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Curator - A music library recommendation core
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "atomic_file_writer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <random>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace curator::utils {

namespace {

auto generateTempPath(const std::filesystem::path& destination)
    -> std::filesystem::path {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<unsigned> dis(100000, 999999);

    std::ostringstream oss;
    oss << destination.filename().string() << ".tmp." << dis(gen);
    return destination.parent_path() / oss.str();
}

void syncFile(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        THROW_PERSISTENCE_EXCEPTION("Cannot open file for fsync: " +
                                    path.string() + ": " +
                                    std::strerror(errno));
    }
    if (::fsync(fd) != 0) {
        auto err = errno;
        ::close(fd);
        THROW_PERSISTENCE_EXCEPTION("fsync failed for " + path.string() +
                                    ": " + std::strerror(err));
    }
    ::close(fd);
}

}  // namespace

AtomicFileWriter::AtomicFileWriter(std::filesystem::path destination)
    : destination_(std::move(destination)),
      tempPath_(generateTempPath(destination_)) {
    file_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        THROW_PERSISTENCE_EXCEPTION("Cannot create temporary file: " +
                                    tempPath_.string());
    }
}

AtomicFileWriter::~AtomicFileWriter() {
    if (!committed_ && !aborted_) {
        abort();
    }
}

void AtomicFileWriter::write(std::string_view data) {
    if (committed_ || aborted_) {
        THROW_PERSISTENCE_EXCEPTION(
            "Cannot write to a committed or aborted file: " +
            destination_.string());
    }
    file_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file_.good()) {
        THROW_PERSISTENCE_EXCEPTION("Write failed: " + tempPath_.string());
    }
}

void AtomicFileWriter::commit() {
    if (committed_ || aborted_) {
        THROW_PERSISTENCE_EXCEPTION(
            "Cannot commit a committed or aborted file: " +
            destination_.string());
    }

    file_.flush();
    if (!file_.good()) {
        THROW_PERSISTENCE_EXCEPTION("Failed to flush " + tempPath_.string());
    }
    file_.close();

    syncFile(tempPath_);

    std::error_code ec;
    std::filesystem::rename(tempPath_, destination_, ec);
    if (ec) {
        THROW_PERSISTENCE_EXCEPTION("Atomic rename to " +
                                    destination_.string() +
                                    " failed: " + ec.message());
    }
    committed_ = true;
}

void AtomicFileWriter::abort() noexcept {
    if (committed_) {
        return;
    }
    if (file_.is_open()) {
        file_.close();
    }
    std::error_code ec;
    std::filesystem::remove(tempPath_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temporary file {}: {}",
                     tempPath_.string(), ec.message());
    }
    aborted_ = true;
}

}  // namespace curator::utils
