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
#include "LabelFileSource.hpp"
#include "../Utils/Logger.hpp"

#include <new>

namespace ClusterSig {
namespace Clustering {

bool ParseLabels(const Utils::JSON::Json& doc, std::vector<int64_t>& labels, ClusterError* err) noexcept {
    labels.clear();
    try {
        const Utils::JSON::Json* array = nullptr;
        if (doc.is_array()) {
            array = &doc;
        }
        else if (doc.is_object() && doc.contains("labels") && doc["labels"].is_array()) {
            array = &doc["labels"];
        }
        else {
            if (err) err->message = "Label file must be an array or an object with a \"labels\" array";
            return false;
        }

        labels.reserve(array->size());
        for (size_t i = 0; i < array->size(); ++i) {
            const auto& value = (*array)[i];
            if (!value.is_number_integer()) {
                if (err) err->message = "Label " + std::to_string(i) + " is not an integer";
                labels.clear();
                return false;
            }
            labels.push_back(value.get<int64_t>());
        }
        return true;
    }
    catch (const Utils::JSON::Json::exception& ex) {
        if (err) err->message = std::string("Malformed label document: ") + ex.what();
    }
    catch (const std::bad_alloc&) {
        if (err) err->message = "Out of memory reading labels";
    }
    labels.clear();
    return false;
}

bool LabelFileSource::Assign(const Features::FeatureTable& table,
                             std::vector<int64_t>& labels,
                             ClusterError* err) noexcept {
    Utils::JSON::Json doc;
    Utils::JSON::Error jsonErr;
    if (!Utils::JSON::LoadFromFile(m_path, doc, &jsonErr)) {
        if (err) err->message = "Cannot read labels from " + m_path.string() + ": " + jsonErr.message;
        return false;
    }

    if (!ParseLabels(doc, labels, err)) {
        return false;
    }

    if (labels.size() != table.RowCount()) {
        CS_LOG_ERROR("ClusterGrouper", "%s holds %zu labels for %zu rows",
                     m_path.c_str(), labels.size(), table.RowCount());
        if (err) {
            err->message = "Label count " + std::to_string(labels.size()) +
                           " does not match row count " + std::to_string(table.RowCount());
        }
        return false;
    }

    CS_LOG_DEBUG("ClusterGrouper", "Read %zu labels from %s", labels.size(), m_path.c_str());
    return true;
}

std::string LabelFileSource::Describe() const {
    return "label file " + m_path.string();
}

} // namespace Clustering
} // namespace ClusterSig
