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
 * @file TestMain.cpp
 * @brief Test runner: logger setup and a per-suite summary listener.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>

#include "../../src/Utils/Logger.hpp"

using namespace ClusterSig::Utils;

namespace {

class SummaryListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestSuiteStart(const ::testing::TestSuite& s) override {
        m_suiteStart = std::chrono::steady_clock::now();
        std::cout << "------------------------------------------------------------------------\n"
                  << "Test Suite: " << s.name() << "\n";
    }

    void OnTestSuiteEnd(const ::testing::TestSuite& s) override {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_suiteStart);
        std::cout << "Suite " << s.name() << " done in " << ms.count() << " ms"
                  << " | Passed: " << s.successful_test_count()
                  << " | Failed: " << s.failed_test_count() << "\n";
        m_passed += s.successful_test_count();
        m_failed += s.failed_test_count();
    }

    void OnTestIterationEnd(const ::testing::UnitTest& /*u*/, int /*iteration*/) override {
        const int total = m_passed + m_failed;
        std::cout << "========================================================================\n"
                  << "  ClusterSig test summary\n"
                  << "  Total:  " << total << "\n"
                  << "  Passed: " << std::setw(4) << m_passed << "\n"
                  << "  Failed: " << std::setw(4) << m_failed << "\n"
                  << "========================================================================\n";
    }

private:
    std::chrono::steady_clock::time_point m_suiteStart;
    int m_passed = 0;
    int m_failed = 0;
};

bool IsListingOnly(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--gtest_list_tests") == 0) return true;
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    const bool listing = IsListingOnly(argc, argv);

    LoggerConfig cfg{};
    cfg.toConsole = !listing;
    cfg.toFile = false;
    cfg.async = false;          // Keep synchronous in test mode
    cfg.minimalLevel = LogLevel::Warn;
    try {
        Logger::Instance().Initialize(cfg);
    }
    catch (const std::exception& ex) {
        std::cerr << "[FATAL] Logger exception: " << ex.what() << "\n";
        return 1;
    }

    ::testing::InitGoogleTest(&argc, argv);

    if (!listing) {
        ::testing::UnitTest::GetInstance()->listeners().Append(new SummaryListener);
    }

    int result = 0;
    try {
        result = RUN_ALL_TESTS();
    }
    catch (const std::exception& ex) {
        std::cerr << "[UNCAUGHT EXCEPTION] " << ex.what() << "\n";
        result = 1;
    }

    Logger::Instance().ShutDown();
    return result;
}
