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
#include "SignatureFormat.hpp"

namespace ClusterSig {
namespace SignatureStore {

bool IsSupportedClusterType(const std::string& type) noexcept {
    for (const char* supported : SUPPORTED_CLUSTER_TYPES) {
        if (type == supported) return true;
    }
    return false;
}

const char* CandidateClassToString(CandidateClass c) noexcept {
    switch (c) {
        case CandidateClass::ConstantUseful: return "constant-useful";
        case CandidateClass::ConstantSuppressed: return "constant-suppressed";
        case CandidateClass::VariableConvertible: return "variable-convertible";
        case CandidateClass::VariableUnconvertible: return "variable-unconvertible";
        default: return "unknown";
    }
}

} // namespace SignatureStore
} // namespace ClusterSig
