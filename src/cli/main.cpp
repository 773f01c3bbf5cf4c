/// @file main.cpp
/// @brief inventory-sense command line entry point

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "cli/csv_reader.h"
#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "report/json_export.h"
#include "service/analytics_service.h"

namespace {

constexpr char kVersion[] = "1.0.0";

const std::vector<std::string> kReports = {
    "overview", "trend", "compare", "top-risky", "alerts",
    "correlation", "inventory", "root-cause", "all",
};

struct Options {
    std::string config_path;
    std::string data_path;
    std::string report = "all";
    std::optional<int64_t> distributor;
    std::optional<int64_t> distributor_2;
    std::string state;
    std::string quarter_a;
    std::string quarter_b;
    std::string severity = invsense::alerting::kFilterAll;
    std::vector<std::string> years;
    std::vector<std::string> months;
    std::string importances_path;
    std::string log_level;
};

/// Run one named report; `out` receives its JSON payload
absl::Status RunReport(const std::string& name,
                       const Options& options,
                       const invsense::service::AnalyticsService& service,
                       invsense::report::json* out) {
    using invsense::report::ToJson;

    if (name == "overview") {
        invsense::analytics::OverviewFilter filter;
        INVSENSE_ASSIGN_OR_RETURN(filter.years, invsense::analytics::ParseYearFilter(options.years));
        filter.months = invsense::analytics::NormalizeMonthFilter(options.months);
        INVSENSE_ASSIGN_OR_RETURN(auto overview, service.GetRiskOverview(filter));
        *out = ToJson(overview);
    } else if (name == "trend") {
        if (!options.distributor) {
            return invsense::InvalidArgumentError("--distributor is required for the trend report");
        }
        INVSENSE_ASSIGN_OR_RETURN(auto trend, service.GetDistributorTrend(*options.distributor));
        *out = ToJson(trend);
    } else if (name == "compare") {
        if (!options.distributor || options.state.empty() ||
            options.quarter_a.empty() || options.quarter_b.empty()) {
            return invsense::InvalidArgumentError(
                "--state, --quarter-a, --quarter-b and --distributor are required for compare");
        }
        invsense::analytics::QuarterComparisonRequest request;
        request.state = options.state;
        request.quarter_a = options.quarter_a;
        request.quarter_b = options.quarter_b;
        request.distributor_ids.push_back(*options.distributor);
        if (options.distributor_2) {
            request.distributor_ids.push_back(*options.distributor_2);
        }
        INVSENSE_ASSIGN_OR_RETURN(auto comparison, service.CompareQuarters(request));
        *out = ToJson(comparison);
    } else if (name == "top-risky") {
        INVSENSE_ASSIGN_OR_RETURN(auto top, service.GetTopRisky());
        *out = ToJson(top);
    } else if (name == "alerts") {
        invsense::alerting::AlertFilter filter;
        filter.severity = options.severity;
        filter.distributor = options.distributor ? std::to_string(*options.distributor)
                                                 : invsense::alerting::kFilterAll;
        if (!options.state.empty()) {
            filter.state = options.state;
        }
        INVSENSE_ASSIGN_OR_RETURN(auto alerts, service.GetAlerts(filter));
        *out = ToJson(alerts);
    } else if (name == "correlation") {
        INVSENSE_ASSIGN_OR_RETURN(auto correlation, service.GetCorrelation());
        *out = ToJson(correlation);
    } else if (name == "inventory") {
        INVSENSE_ASSIGN_OR_RETURN(auto overview, service.GetInventoryOverview());
        INVSENSE_ASSIGN_OR_RETURN(auto charts, service.GetInventoryCharts());
        INVSENSE_ASSIGN_OR_RETURN(auto status, service.GetDistributorAllowanceStatus());
        *out = {
            {"overview", ToJson(overview)},
            {"charts", ToJson(charts)},
            {"distributor_status", ToJson(status)},
        };
    } else if (name == "root-cause") {
        if (options.importances_path.empty()) {
            return invsense::InvalidArgumentError("--importances is required for root-cause");
        }
        INVSENSE_ASSIGN_OR_RETURN(auto importances,
                                  invsense::cli::ReadFeatureImportances(options.importances_path));
        INVSENSE_ASSIGN_OR_RETURN(auto report, service.GetRootCause(importances));
        *out = ToJson(report);
    } else {
        return invsense::InvalidArgumentError("Unknown report: " + name);
    }
    return absl::OkStatus();
}

/// Every report whose inputs were given; per-report failures are reported inline
invsense::report::json RunAllReports(const Options& options,
                                     const invsense::service::AnalyticsService& service) {
    invsense::report::json all = invsense::report::json::object();
    for (const auto& name : kReports) {
        if (name == "all") continue;
        if (name == "trend" && !options.distributor) continue;
        if (name == "compare" && (options.state.empty() || options.quarter_a.empty())) continue;
        if (name == "root-cause" && options.importances_path.empty()) continue;

        invsense::report::json payload;
        auto status = RunReport(name, options, service, &payload);
        if (!status.ok()) {
            INVSENSE_LOG_WARN("Report '{}' failed: {}", name, status.message());
            payload = {{"error", std::string(status.message())}};
        }
        all[name] = std::move(payload);
    }
    return all;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"inventory-sense - distributor inventory risk analytics"};

    Options options;
    bool version_flag = false;

    app.add_option("-c,--config", options.config_path, "Path to YAML configuration file");
    app.add_option("-d,--data", options.data_path, "Distributor transactions CSV");
    app.add_option("-r,--report", options.report, "Report to produce")
        ->check(CLI::IsMember(kReports));
    int64_t distributor = 0;
    int64_t distributor_2 = 0;
    auto* distributor_opt = app.add_option("--distributor", distributor, "Distributor ID");
    auto* distributor_2_opt =
        app.add_option("--distributor-2", distributor_2, "Second distributor ID for compare");
    app.add_option("--state", options.state, "US state");
    app.add_option("--quarter-a", options.quarter_a, "First quarter, e.g. \"2022 Q2\"");
    app.add_option("--quarter-b", options.quarter_b, "Second quarter, e.g. \"2023 Q1\"");
    app.add_option("--severity", options.severity, "Alert severity filter (ALL, HIGH, MEDIUM, LOW)");
    app.add_option("--year", options.years, "Overview year filter (repeatable)");
    app.add_option("--month", options.months, "Overview month filter, e.g. Feb (repeatable)");
    app.add_option("--importances", options.importances_path,
                   "CSV of feature,importance for the root-cause report");
    app.add_option("--log-level", options.log_level,
                   "Log level (trace, debug, info, warn, error)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (distributor_opt->count() > 0) {
        options.distributor = distributor;
    }
    if (distributor_2_opt->count() > 0) {
        options.distributor_2 = distributor_2;
    }

    if (version_flag) {
        std::cout << "inventory-sense v" << kVersion << std::endl;
        return 0;
    }

    std::optional<std::filesystem::path> config_path;
    if (!options.config_path.empty()) {
        config_path = options.config_path;
    }
    auto config = invsense::LoadLayeredConfig(config_path);
    if (!config.ok()) {
        std::cerr << "Failed to load config: " << config.status().message() << std::endl;
        return 1;
    }

    // Initialize logging
    invsense::LogConfig log_config;
    log_config.name = "inventory-sense";
    std::string level_name = options.log_level.empty()
        ? config->GetString("logging.level", "info")
        : options.log_level;
    auto level = invsense::ParseLogLevel(level_name);
    if (!level) {
        std::cerr << "Unknown log level: " << level_name << std::endl;
        return 1;
    }
    log_config.level = *level;
    if (config->HasKey("logging.file")) {
        log_config.enable_file = true;
        log_config.file_path = config->GetString("logging.file");
    }
    invsense::InitLogging(log_config);

    INVSENSE_LOG_INFO("inventory-sense v{} starting", kVersion);

    auto settings = invsense::service::AnalyticsSettings::FromConfig(*config);
    if (!settings.ok()) {
        INVSENSE_LOG_ERROR("Invalid configuration: {}", settings.status().message());
        invsense::ShutdownLogging();
        return 1;
    }

    std::string data_path = options.data_path.empty()
        ? config->GetString("data.path")
        : options.data_path;
    if (data_path.empty()) {
        INVSENSE_LOG_ERROR("No dataset given (--data or data.path)");
        invsense::ShutdownLogging();
        return 1;
    }

    auto table = invsense::cli::ReadCsvFile(data_path);
    if (!table.ok()) {
        INVSENSE_LOG_ERROR("Failed to read {}: {}", data_path, table.status().message());
        invsense::ShutdownLogging();
        return 1;
    }

    invsense::service::AnalyticsService service(*settings);
    auto version = service.UploadDataset(std::move(table).value());
    if (!version.ok()) {
        INVSENSE_LOG_ERROR("Dataset rejected: {}", version.status().message());
        invsense::ShutdownLogging();
        return 1;
    }

    invsense::report::json output;
    if (options.report == "all") {
        output = RunAllReports(options, service);
    } else {
        auto status = RunReport(options.report, options, service, &output);
        if (!status.ok()) {
            INVSENSE_LOG_ERROR("Report '{}' failed: {} ({})", options.report, status.message(),
                               invsense::ErrorCodeToString(
                                   invsense::GetErrorCode(status).value_or(
                                       invsense::ErrorCode::kUnknown)));
            invsense::ShutdownLogging();
            return 1;
        }
    }

    std::cout << invsense::report::Dump(output) << std::endl;

    invsense::ShutdownLogging();
    return 0;
}
