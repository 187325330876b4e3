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
 * @file Main.cpp
 * @brief clustersig command line driver.
 *
 *   clustersig extract    -i DIR -o TABLE.json
 *   clustersig synthesize -t TABLE.json -l LABELS.json -k TYPE -o OUTDIR
 *   clustersig run        -i DIR -l LABELS.json -k TYPE -o OUTDIR
 *
 * Exit codes: 0 ok, 1 usage, 2 empty input, 3 I/O or format error.
 */

#include "Config/PipelineConfig.hpp"
#include "Pipeline/Pipeline.hpp"
#include "Utils/Logger.hpp"

#include <getopt.h>

#include <cstdio>
#include <cstring>
#include <optional>
#include <string>

using namespace ClusterSig;

namespace {

enum class Command {
    Extract,
    Synthesize,
    Run,
};

struct CliArgs {
    Command command = Command::Extract;
    std::string input;
    std::string output;
    std::string table;
    std::string labels;
    std::optional<std::string> configPath;
    Config::ConfigOverrides overrides;
};

void usage(const char* argv0, bool verbose) {
    fprintf(stderr, "usage: %s <extract|synthesize|run> [options]\n", argv0);
    if (verbose) {
        fprintf(stderr, "\n");
        fprintf(stderr, "  extract    -i DIR -o TABLE.json\n");
        fprintf(stderr, "  synthesize -t TABLE.json -l LABELS.json -k TYPE -o OUTDIR\n");
        fprintf(stderr, "  run        -i DIR -l LABELS.json -k TYPE -o OUTDIR\n");
        fprintf(stderr, "\n");
        fprintf(stderr, "  -i, --input=DIR          Directory of candidate PE files\n");
        fprintf(stderr, "  -o, --output=PATH        Table file (extract) or rule directory\n");
        fprintf(stderr, "  -t, --table=FILE         Feature table written by extract\n");
        fprintf(stderr, "  -l, --labels=FILE        Cluster labels, one per table row\n");
        fprintf(stderr, "  -k, --cluster-type=TYPE  dbscan, meanshift or kmeans\n");
        fprintf(stderr, "  -c, --config=FILE        JSON configuration\n");
        fprintf(stderr, "  -a, --author=NAME        Rule author\n");
        fprintf(stderr, "  -m, --contact=TEXT       Rule contact\n");
        fprintf(stderr, "  -x, --experimental       Tiny PE parsing and COFF header patterns\n");
        fprintf(stderr, "  -v, --verbose            Debug logging\n");
        fprintf(stderr, "  -h, --help               This list\n");
    }
}

std::optional<Command> parseCommand(const char* name) {
    if (std::strcmp(name, "extract") == 0) return Command::Extract;
    if (std::strcmp(name, "synthesize") == 0) return Command::Synthesize;
    if (std::strcmp(name, "run") == 0) return Command::Run;
    return std::nullopt;
}

/// @return exit code to stop with, or nullopt to continue
std::optional<int> parseArgs(int argc, char* argv[], CliArgs& args) {
    if (argc < 2) {
        usage(argv[0], false);
        return 1;
    }
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        usage(argv[0], true);
        return 0;
    }

    const auto command = parseCommand(argv[1]);
    if (!command) {
        fprintf(stderr, "%s: unknown command '%s'\n", argv[0], argv[1]);
        usage(argv[0], false);
        return 1;
    }
    args.command = *command;

    static struct option long_options[] = {
        {"input",        required_argument, nullptr, 'i'},
        {"output",       required_argument, nullptr, 'o'},
        {"table",        required_argument, nullptr, 't'},
        {"labels",       required_argument, nullptr, 'l'},
        {"cluster-type", required_argument, nullptr, 'k'},
        {"config",       required_argument, nullptr, 'c'},
        {"author",       required_argument, nullptr, 'a'},
        {"contact",      required_argument, nullptr, 'm'},
        {"experimental", no_argument,       nullptr, 'x'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {"help",         no_argument,       nullptr, 'h'},
        {nullptr,        0,                 nullptr, 0}
    };

    // Options follow the command word
    optind = 2;
    for (;;) {
        int option_index = 0;
        const int c = getopt_long(argc, argv, "i:o:t:l:k:c:a:m:xvh", long_options, &option_index);
        if (c == -1)
            break;

        switch (c) {
        case 'i':
            args.input = optarg;
            break;
        case 'o':
            args.output = optarg;
            break;
        case 't':
            args.table = optarg;
            break;
        case 'l':
            args.labels = optarg;
            break;
        case 'k':
            args.overrides.clusterType = optarg;
            break;
        case 'c':
            args.configPath = optarg;
            break;
        case 'a':
            args.overrides.author = optarg;
            break;
        case 'm':
            args.overrides.contact = optarg;
            break;
        case 'x':
            args.overrides.experimental = true;
            break;
        case 'v':
            args.overrides.verbose = true;
            break;
        case 'h':
            usage(argv[0], true);
            return 0;
        case '?':
            fprintf(stderr, "Try `%s --help' for more information.\n", argv[0]);
            return 1;
        default:
            fprintf(stderr, "getopt_long() returned character code %d\n", c);
            return 1;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "%s: unexpected argument '%s'\n", argv[0], argv[optind]);
        return 1;
    }

    // Required arguments per command
    const char* missing = nullptr;
    switch (args.command) {
    case Command::Extract:
        if (args.input.empty()) missing = "-i";
        else if (args.output.empty()) missing = "-o";
        break;
    case Command::Synthesize:
        if (args.table.empty()) missing = "-t";
        else if (args.labels.empty()) missing = "-l";
        break;
    case Command::Run:
        if (args.input.empty()) missing = "-i";
        else if (args.labels.empty()) missing = "-l";
        break;
    }
    if (missing) {
        fprintf(stderr, "%s %s: missing %s\n", argv[0], argv[1], missing);
        usage(argv[0], false);
        return 1;
    }

    if (args.command != Command::Extract && !args.output.empty()) {
        args.overrides.outputDirectory = args.output;
    }
    return std::nullopt;
}

int configErrorExit(const Config::ConfigError& err) {
    return err.kind == Config::ConfigErrorKind::Usage
        ? Pipeline::ExitCode(Pipeline::PipelineStatus::UsageError)
        : Pipeline::ExitCode(Pipeline::PipelineStatus::IoError);
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    if (const auto exitCode = parseArgs(argc, argv, args)) {
        return *exitCode;
    }

    // Console logging until the configured sinks are known
    Utils::Logger::Instance().Initialize(Utils::LoggerConfig{});

    Config::PipelineConfig config;
    Config::ConfigError configErr;
    if (args.configPath && !Config::LoadConfig(*args.configPath, config, &configErr)) {
        CS_LOG_ERROR("Config", "%s", configErr.message.c_str());
        Utils::Logger::Instance().ShutDown();
        return configErrorExit(configErr);
    }
    Config::ApplyOverrides(args.overrides, config);

    Utils::LoggerConfig logConfig;
    if (!Config::Validate(config, &configErr) || !config.ToLoggerConfig(logConfig, &configErr)) {
        CS_LOG_ERROR("Config", "%s", configErr.message.c_str());
        Utils::Logger::Instance().ShutDown();
        return configErrorExit(configErr);
    }
    Utils::Logger::Instance().Initialize(logConfig);

    Pipeline::Pipeline pipeline(config);
    Pipeline::RunReport report;
    Pipeline::PipelineError err;
    bool ok = false;

    switch (args.command) {
    case Command::Extract:
        ok = pipeline.RunExtract(args.input, args.output, report, &err);
        break;
    case Command::Synthesize:
        ok = pipeline.RunSynthesize(args.table, args.labels, report, &err);
        break;
    case Command::Run:
        ok = pipeline.RunAll(args.input, args.labels, report, &err);
        break;
    }

    report.Log();
    fputs(report.ToText().c_str(), stdout);

    Utils::Logger::Instance().ShutDown();
    if (ok) return 0;
    return err.hasError() ? Pipeline::ExitCode(err.status) : Pipeline::ExitCode(Pipeline::PipelineStatus::IoError);
}
