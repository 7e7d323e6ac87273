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

#ifndef CURATOR_UTILS_ATOMIC_FILE_WRITER_HPP
#define CURATOR_UTILS_ATOMIC_FILE_WRITER_HPP

#include <filesystem>
#include <fstream>
#include <string_view>

namespace curator::utils {

/**
 * @brief Whole-file rewrite with an atomic commit
 *
 * Content is written to a sibling temporary file; commit() flushes, fsyncs
 * and renames it over the destination, so readers observe either the old
 * or the new document. A writer destroyed without commit() removes its
 * temporary file.
 *
 * All failures throw curator::PersistenceException.
 */
class AtomicFileWriter {
public:
    explicit AtomicFileWriter(std::filesystem::path destination);
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    void write(std::string_view data);

    void commit();

    void abort() noexcept;

    [[nodiscard]] auto tempPath() const -> const std::filesystem::path& {
        return tempPath_;
    }

private:
    std::filesystem::path destination_;
    std::filesystem::path tempPath_;
    std::ofstream file_;
    bool committed_{false};
    bool aborted_{false};
};

}  // namespace curator::utils

#endif  // CURATOR_UTILS_ATOMIC_FILE_WRITER_HPP
