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
/**
 * @file FeatureTable.cpp
 * @brief Table assembly, sentinel filling and JSON persistence.
 */

#include "FeatureTable.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <array>
#include <new>
#include <stdexcept>
#include <utility>

namespace ClusterSig {
namespace Features {

namespace {

using Utils::JSON::Json;

void SetError(TableError* err, std::string message) {
    if (err) {
        err->message = std::move(message);
    }
}

Json ValueToJson(const FeatureValue& value) {
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        return Json(*u);
    }
    if (const auto* s = std::get_if<int64_t>(&value)) {
        return Json(*s);
    }
    return Json(std::get<std::string>(value));
}

bool CellFromJson(const Json& j, FeatureCell& cell, std::string& why) {
    if (j.is_number_unsigned()) {
        cell.state = CellState::Present;
        cell.value = j.get<uint64_t>();
        return true;
    }
    if (j.is_number_integer()) {
        const int64_t v = j.get<int64_t>();
        if (v == kSentinel) {
            cell.state = CellState::Sentinel;
            cell.value = kSentinel;
        }
        else {
            cell.state = CellState::Present;
            cell.value = v;
        }
        return true;
    }
    if (j.is_string()) {
        cell.state = CellState::Present;
        cell.value = j.get<std::string>();
        return true;
    }
    why = j.is_number_float() ? "non-integer number" : "unsupported value type";
    return false;
}

} // namespace

// ============================================================================
// Build
// ============================================================================

bool FeatureTable::Build(const std::vector<FeatureRecord>& records, FeatureTable& out, TableError* err) {
    out = FeatureTable();

    if (records.empty()) {
        SetError(err, "No usable input: zero feature records");
        CS_LOG_ERROR("FeatureTable", "Cannot build a feature table from zero records");
        return false;
    }

    // Union of present fields in first-seen order
    std::array<bool, kFeatureCount> seen{};
    for (const auto& record : records) {
        for (FeatureId id : record.PresentIds()) {
            if (!seen[ToIndex(id)]) {
                seen[ToIndex(id)] = true;
                out.m_columns.push_back(id);
            }
        }
    }

    out.m_rows.reserve(records.size());
    for (const auto& record : records) {
        TableRow row;
        row.filename = record.Filename();
        row.cells.resize(out.m_columns.size());
        for (size_t c = 0; c < out.m_columns.size(); ++c) {
            const auto& value = record.Get(out.m_columns[c]);
            if (value) {
                row.cells[c].state = CellState::Present;
                row.cells[c].value = *value;
            }
        }
        out.m_rows.push_back(std::move(row));
    }

    CS_LOG_DEBUG("FeatureTable", "Built table: %zu rows, %zu columns",
                 out.m_rows.size(), out.m_columns.size());
    return true;
}

bool FeatureTable::Assign(std::vector<FeatureId> columns, std::vector<TableRow> rows, TableError* err) {
    std::array<bool, kFeatureCount> seen{};
    for (FeatureId id : columns) {
        if (ToIndex(id) >= kFeatureCount) {
            SetError(err, "Column id out of range");
            return false;
        }
        if (seen[ToIndex(id)]) {
            SetError(err, std::string("Duplicate column: ") + FeatureName(id));
            return false;
        }
        seen[ToIndex(id)] = true;
    }
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].cells.size() != columns.size()) {
            SetError(err, "Row " + std::to_string(r) + " has " + std::to_string(rows[r].cells.size()) +
                          " cells, expected " + std::to_string(columns.size()));
            return false;
        }
    }

    m_columns = std::move(columns);
    m_rows = std::move(rows);
    m_labels.reset();
    return true;
}

// ============================================================================
// Sentinel filling
// ============================================================================

void FeatureTable::FillSentinels() noexcept {
    auto fill = [this](bool resourceOnly) {
        for (size_t c = 0; c < m_columns.size(); ++c) {
            if (resourceOnly && !IsResourceField(m_columns[c])) {
                continue;
            }
            for (auto& row : m_rows) {
                FeatureCell& cell = row.cells[c];
                if (cell.state == CellState::Absent) {
                    cell.state = CellState::Sentinel;
                    cell.value = kSentinel;
                }
            }
        }
    };

    // Resource leaves are commonly missing, so their columns go first
    fill(true);
    fill(false);
}

bool FeatureTable::IsFilled() const noexcept {
    for (const auto& row : m_rows) {
        for (const auto& cell : row.cells) {
            if (cell.state == CellState::Absent) return false;
        }
    }
    return true;
}

// ============================================================================
// Access
// ============================================================================

std::optional<size_t> FeatureTable::ColumnIndex(FeatureId id) const noexcept {
    for (size_t c = 0; c < m_columns.size(); ++c) {
        if (m_columns[c] == id) return c;
    }
    return std::nullopt;
}

const FeatureCell& FeatureTable::Cell(size_t row, size_t column) const {
    return m_rows.at(row).cells.at(column);
}

FeatureValue FeatureTable::Value(size_t row, size_t column) const {
    return Cell(row, column).Export();
}

bool FeatureTable::AttachLabels(std::vector<int64_t> labels, TableError* err) {
    if (labels.size() != m_rows.size()) {
        SetError(err, "Label count " + std::to_string(labels.size()) +
                      " does not match row count " + std::to_string(m_rows.size()));
        return false;
    }
    m_labels = std::move(labels);
    return true;
}

FeatureTable FeatureTable::Subset(const std::vector<size_t>& rows) const {
    FeatureTable sub;
    sub.m_columns = m_columns;
    sub.m_rows.reserve(rows.size());
    if (m_labels) {
        sub.m_labels.emplace();
        sub.m_labels->reserve(rows.size());
    }
    for (size_t r : rows) {
        sub.m_rows.push_back(m_rows.at(r));
        if (m_labels) {
            sub.m_labels->push_back(m_labels->at(r));
        }
    }
    return sub;
}

std::vector<size_t> FeatureTable::NumericColumns() const {
    std::vector<size_t> numeric;
    for (size_t c = 0; c < m_columns.size(); ++c) {
        bool allNumbers = true;
        for (const auto& row : m_rows) {
            if (row.cells[c].IsPresent() && !IsNumeric(row.cells[c].value)) {
                allNumbers = false;
                break;
            }
        }
        if (allNumbers) numeric.push_back(c);
    }
    return numeric;
}

std::vector<std::vector<double>> FeatureTable::ToNumericMatrix() const {
    const std::vector<size_t> columns = NumericColumns();
    std::vector<std::vector<double>> matrix;
    matrix.reserve(m_rows.size());
    for (size_t r = 0; r < m_rows.size(); ++r) {
        std::vector<double> line;
        line.reserve(columns.size());
        for (size_t c : columns) {
            line.push_back(ToDouble(Value(r, c)).value_or(static_cast<double>(kSentinel)));
        }
        matrix.push_back(std::move(line));
    }
    return matrix;
}

// ============================================================================
// Persistence
// ============================================================================

bool SaveTable(const std::filesystem::path& path, const FeatureTable& table,
               const PreprocessOptions& preprocess, TableError* err) {
    Json doc = Json::object();
    try {
        Json columns = Json::array();
        for (FeatureId id : table.Columns()) {
            columns.push_back(FeatureName(id));
        }
        doc["columns"] = std::move(columns);

        Json rows = Json::array();
        for (size_t r = 0; r < table.RowCount(); ++r) {
            Json values = Json::array();
            for (size_t c = 0; c < table.ColumnCount(); ++c) {
                values.push_back(ValueToJson(table.Value(r, c)));
            }
            rows.push_back(Json{ {"filename", table.Filename(r)}, {"values", std::move(values)} });
        }
        doc["rows"] = std::move(rows);

        if (table.HasLabels()) {
            doc["cluster"] = *table.Labels();
        }

        doc["matrix"] = table.ToNumericMatrix();

        Json pre = Json::object();
        pre["scale"] = preprocess.scale;
        if (preprocess.components) {
            pre["components"] = *preprocess.components;
        }
        else {
            pre["components"] = "auto";
        }
        doc["preprocess"] = std::move(pre);
    }
    catch (const Json::exception& ex) {
        SetError(err, std::string("Cannot serialize feature table: ") + ex.what());
        return false;
    }

    Utils::JSON::SaveOptions opts;
    opts.pretty = true;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::SaveToFile(path, doc, &jsonErr, opts)) {
        SetError(err, "Cannot write feature table " + path.string() + ": " + jsonErr.message);
        CS_LOG_ERROR("FeatureTable", "%s", jsonErr.message.c_str());
        return false;
    }

    CS_LOG_INFO("FeatureTable", "Saved %zu rows x %zu columns to %s",
                table.RowCount(), table.ColumnCount(), path.c_str());
    return true;
}

bool LoadTable(const std::filesystem::path& path, FeatureTable& out,
               PreprocessOptions* preprocess, TableError* err) {
    out = FeatureTable();

    Json doc;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::LoadFromFile(path, doc, &jsonErr)) {
        SetError(err, "Cannot read feature table " + path.string() + ": " + jsonErr.message);
        return false;
    }

    try {
        if (!doc.is_object() || !doc.contains("columns") || !doc.contains("rows") ||
            !doc["columns"].is_array() || !doc["rows"].is_array()) {
            SetError(err, "Feature table needs \"columns\" and \"rows\" arrays");
            return false;
        }

        std::vector<FeatureId> columns;
        for (const auto& name : doc["columns"]) {
            if (!name.is_string()) {
                SetError(err, "Column names must be strings");
                return false;
            }
            const auto id = FindFeature(name.get<std::string>());
            if (!id) {
                SetError(err, "Unknown column: " + name.get<std::string>());
                return false;
            }
            columns.push_back(*id);
        }

        std::vector<TableRow> rows;
        const Json& jrows = doc["rows"];
        rows.reserve(jrows.size());
        for (size_t r = 0; r < jrows.size(); ++r) {
            const Json& jrow = jrows[r];
            if (!jrow.is_object() || !jrow.contains("filename") || !jrow["filename"].is_string() ||
                !jrow.contains("values") || !jrow["values"].is_array()) {
                SetError(err, "Row " + std::to_string(r) + " needs a filename and a values array");
                return false;
            }
            const Json& values = jrow["values"];
            if (values.size() != columns.size()) {
                SetError(err, "Row " + std::to_string(r) + " has " + std::to_string(values.size()) +
                              " values, expected " + std::to_string(columns.size()));
                return false;
            }

            TableRow row;
            row.filename = jrow["filename"].get<std::string>();
            row.cells.resize(columns.size());
            for (size_t c = 0; c < columns.size(); ++c) {
                std::string why;
                if (!CellFromJson(values[c], row.cells[c], why)) {
                    SetError(err, "Row " + std::to_string(r) + ", column \"" +
                                  FeatureName(columns[c]) + "\": " + why);
                    return false;
                }
            }
            rows.push_back(std::move(row));
        }

        if (!out.Assign(std::move(columns), std::move(rows), err)) {
            return false;
        }

        if (doc.contains("cluster") && !doc["cluster"].is_null()) {
            std::vector<int64_t> labels;
            for (const auto& label : doc["cluster"]) {
                if (!label.is_number_integer()) {
                    SetError(err, "Cluster labels must be integers");
                    return false;
                }
                labels.push_back(label.get<int64_t>());
            }
            if (!out.AttachLabels(std::move(labels), err)) {
                return false;
            }
        }

        if (preprocess) {
            *preprocess = PreprocessOptions{};
            preprocess->scale = Utils::JSON::GetOr<bool>(doc, "preprocess.scale", true);
            if (Utils::JSON::Contains(doc, "preprocess.components")) {
                const Json& comp = doc["preprocess"]["components"];
                if (comp.is_number_unsigned()) {
                    preprocess->components = comp.get<uint32_t>();
                }
            }
        }
    }
    catch (const Json::exception& ex) {
        SetError(err, std::string("Malformed feature table: ") + ex.what());
        out = FeatureTable();
        return false;
    }

    CS_LOG_INFO("FeatureTable", "Loaded %zu rows x %zu columns from %s",
                out.RowCount(), out.ColumnCount(), path.c_str());
    return true;
}

} // namespace Features
} // namespace ClusterSig
