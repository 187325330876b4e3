/*
 * ClusterSig - PE Header Clustering and Signature Synthesis
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file FeatureTable.hpp
 * @brief Uniform table over many feature records.
 *
 * Columns are the union of fields seen across the records, in first-seen
 * order. Cells keep three states so that "the file lacked this field" and
 * "this column never existed for the row" stay apart until export, where
 * both collapse to the -1 sentinel.
 *
 * The table round-trips through a JSON file so that clustering can run
 * out of process:
 * @code
 *   {
 *     "columns": ["machine type", ...],
 *     "rows": [ { "filename": "a.exe", "values": [332, ...] }, ... ],
 *     "cluster": [0, 0, -1, ...],            // optional
 *     "matrix": [[332.0, ...], ...],
 *     "preprocess": { "scale": true, "components": "auto" }
 *   }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "FeatureRecord.hpp"

namespace ClusterSig {
namespace Features {

// ============================================================================
// CELLS
// ============================================================================

enum class CellState : uint8_t {
    Absent = 0,     ///< Never observed for this row
    Present,        ///< Parsed value
    Sentinel,       ///< Intentionally filled with -1
};

struct FeatureCell {
    CellState state = CellState::Absent;
    FeatureValue value{kSentinel};

    [[nodiscard]] bool IsPresent() const noexcept { return state == CellState::Present; }

    /// Present value, or -1 for the other states
    [[nodiscard]] FeatureValue Export() const {
        return state == CellState::Present ? value : FeatureValue{kSentinel};
    }
};

struct TableRow {
    std::string filename;
    std::vector<FeatureCell> cells;     ///< One per column
};

struct TableError {
    std::string message;

    [[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
    void clear() noexcept { message.clear(); }
};

/**
 * @brief Directives handed through to the external clusterer.
 */
struct PreprocessOptions {
    bool scale = true;                      ///< Center and scale columns
    std::optional<uint32_t> components;     ///< Target dimensions; nullopt means "auto"
};

// ============================================================================
// FEATURE TABLE
// ============================================================================

class FeatureTable {
public:
    /**
     * @brief Build a table from records.
     *
     * Cells are left Absent where a record lacks a column; call
     * FillSentinels() afterwards.
     *
     * @return false with err set when there are no records.
     */
    [[nodiscard]] static bool Build(const std::vector<FeatureRecord>& records,
                                    FeatureTable& out,
                                    TableError* err = nullptr);

    /**
     * @brief Replace every Absent cell with the sentinel.
     *
     * Resource columns are filled first, then all the rest. Filling a
     * table without Absent cells changes nothing.
     */
    void FillSentinels() noexcept;

    /// No Absent cell left
    [[nodiscard]] bool IsFilled() const noexcept;

    [[nodiscard]] size_t RowCount() const noexcept { return m_rows.size(); }
    [[nodiscard]] size_t ColumnCount() const noexcept { return m_columns.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_rows.empty(); }

    [[nodiscard]] const std::vector<FeatureId>& Columns() const noexcept { return m_columns; }
    [[nodiscard]] const std::vector<TableRow>& Rows() const noexcept { return m_rows; }

    [[nodiscard]] std::optional<size_t> ColumnIndex(FeatureId id) const noexcept;

    [[nodiscard]] const std::string& Filename(size_t row) const { return m_rows.at(row).filename; }
    [[nodiscard]] const FeatureCell& Cell(size_t row, size_t column) const;

    /// Exported value of a cell (-1 unless Present)
    [[nodiscard]] FeatureValue Value(size_t row, size_t column) const;

    // ========================================================================
    // Cluster labels
    // ========================================================================

    /**
     * @brief Attach one cluster label per row. -1 marks noise.
     * @return false when the count does not match the row count.
     */
    [[nodiscard]] bool AttachLabels(std::vector<int64_t> labels, TableError* err = nullptr);

    [[nodiscard]] bool HasLabels() const noexcept { return m_labels.has_value(); }
    [[nodiscard]] const std::optional<std::vector<int64_t>>& Labels() const noexcept { return m_labels; }

    /**
     * @brief Copy of the given rows with the same column schema.
     *
     * Labels, when attached, follow their rows.
     */
    [[nodiscard]] FeatureTable Subset(const std::vector<size_t>& rows) const;

    // ========================================================================
    // Numeric export
    // ========================================================================

    /// Columns without any string cell, by index
    [[nodiscard]] std::vector<size_t> NumericColumns() const;

    /// Rows x NumericColumns(), cells exported as double
    [[nodiscard]] std::vector<std::vector<double>> ToNumericMatrix() const;

    /**
     * @brief Replace the contents with prepared columns and rows.
     * @return false when a column repeats or a row has the wrong cell count.
     */
    [[nodiscard]] bool Assign(std::vector<FeatureId> columns,
                              std::vector<TableRow> rows,
                              TableError* err = nullptr);

private:
    std::vector<FeatureId> m_columns;
    std::vector<TableRow> m_rows;
    std::optional<std::vector<int64_t>> m_labels;
};

// ============================================================================
// PERSISTENCE
// ============================================================================

/**
 * @brief Write the table, labels and numeric matrix as JSON (atomic replace).
 */
[[nodiscard]] bool SaveTable(const std::filesystem::path& path,
                             const FeatureTable& table,
                             const PreprocessOptions& preprocess,
                             TableError* err = nullptr);

/**
 * @brief Read a table written by SaveTable.
 *
 * Unknown column names, rows whose value count differs from the column
 * count and non-integer numbers are rejected. A -1 loads as a Sentinel
 * cell. The matrix is ignored; it is recomputed from the cells.
 */
[[nodiscard]] bool LoadTable(const std::filesystem::path& path,
                             FeatureTable& out,
                             PreprocessOptions* preprocess = nullptr,
                             TableError* err = nullptr);

} // namespace Features
} // namespace ClusterSig
