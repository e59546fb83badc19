/// @file stats_service.cpp
/// @brief Stats service implementation

#include "analysis/stats_service.h"

#include <chrono>
#include <exception>
#include <future>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace rootscope::analysis {

using json = nlohmann::json;

// =============================================================================
// Configuration
// =============================================================================

absl::StatusOr<StatsServiceConfig> StatsServiceConfig::FromConfig(const Config& config) {
    StatsServiceConfig result;
    result.store.base_dir = config.GetString("store.base_dir", "flow_context");

    const int64_t top_k = config.GetInt("analysis.top_k", 10);
    if (top_k < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("analysis.top_k must be >= 0, got ", top_k));
    }
    if (top_k == 0) {
        result.top_k = std::nullopt;
    } else {
        result.top_k = static_cast<size_t>(top_k);
    }

    result.parallel_branches = config.GetBool("analysis.parallel_branches", true);
    result.metadata_path = config.GetString("metadata.path", "");
    return result;
}

// =============================================================================
// StatsService
// =============================================================================

StatsService::StatsService(store::ArtifactStore& store,
                           StatsServiceConfig config,
                           std::shared_ptr<const DriverMetadataProvider> metadata)
    : store_(store),
      config_(std::move(config)),
      correlation_engine_(config_.correlation),
      ranker_(config_.ranker, std::move(metadata)),
      outlier_detector_(config_.outliers) {
    if (config_.parallel_branches) {
        pool_ = std::make_unique<ThreadPool>(2);
    }
}

StatsService::~StatsService() = default;

absl::StatusOr<std::shared_ptr<const DriverMetadataProvider>> StatsService::LoadMetadata(
    const StatsServiceConfig& config) {
    if (config.metadata_path.empty()) {
        return std::shared_ptr<const DriverMetadataProvider>{};
    }
    auto provider = JsonDriverMetadataProvider::LoadFromFile(config.metadata_path);
    if (!provider.ok()) {
        if (GetErrorCode(provider.status()) == ErrorCode::kFileNotFound) {
            ROOTSCOPE_LOG_WARN("Driver metadata not found at {}, ranking without enrichment",
                               config.metadata_path);
            return std::shared_ptr<const DriverMetadataProvider>{};
        }
        return provider.status();
    }
    return std::shared_ptr<const DriverMetadataProvider>(
        std::make_shared<JsonDriverMetadataProvider>(std::move(*provider)));
}

CorrelationResult StatsService::ComputeCorrelations(const store::Table& table,
                                                    std::string_view kpi) {
    CorrelationResult result;
    result.kpi_name = std::string(kpi);

    auto records = RunCorrelation(table, kpi);
    if (records.ok()) {
        result.drivers = std::move(*records);
    } else {
        ROOTSCOPE_LOG_ERROR("Stage {} failed: {}", stage::kCorrelation,
                            records.status().ToString());
        result.error = MakeErrorEnvelope(records.status(), stage::kCorrelation);
    }

    Persist(artifact::kCorrelationMatrix, result.ToJson());
    return result;
}

RankingResult StatsService::RankImpact(const CorrelationResult& correlation) {
    RankingResult result;
    result.kpi_name = correlation.kpi_name;

    if (correlation.HasError()) {
        ROOTSCOPE_LOG_WARN("Skipping ranking for '{}': upstream stage {} failed",
                           correlation.kpi_name, correlation.error->stage);
        result.error = correlation.error;
    } else {
        auto ranking = RunRanking(correlation.drivers);
        if (ranking.ok()) {
            result.ranking = std::move(*ranking);
        } else {
            ROOTSCOPE_LOG_ERROR("Stage {} failed: {}", stage::kRanking,
                                ranking.status().ToString());
            result.error = MakeErrorEnvelope(ranking.status(), stage::kRanking);
        }
    }

    Persist(artifact::kImpactRanking, result.ToJson());
    return result;
}

OutlierResult StatsService::DetectOutliers(const store::Table& table, std::string_view kpi) {
    OutlierResult result;
    result.kpi = std::string(kpi);

    auto outliers = RunOutliers(table, kpi);
    if (outliers.ok()) {
        result.outliers = std::move(*outliers);
    } else {
        ROOTSCOPE_LOG_ERROR("Stage {} failed: {}", stage::kOutliers,
                            outliers.status().ToString());
        result.error = MakeErrorEnvelope(outliers.status(), stage::kOutliers);
    }
    result.summary = SummarizeOutliers(result.outliers);

    Persist(artifact::kOutlierReport, result.ToJson());
    return result;
}

PipelineResult StatsService::RunPipeline(const store::TableInput& input, std::string_view kpi) {
    auto start_time = std::chrono::steady_clock::now();
    PipelineResult result;

    auto table = store::ResolveTableInput(store_, input);
    if (table.ok()) {
        auto ref = store_.SaveTable(std::string(artifact::kUnifiedDataset), *table);
        if (ref.ok()) {
            result.dataset_ref = std::move(*ref);
        } else {
            // The stages can still run on the in-memory table
            ROOTSCOPE_LOG_ERROR("Failed to persist {}: {}", artifact::kUnifiedDataset,
                                ref.status().ToString());
        }
    }

    if (!table.ok()) {
        ROOTSCOPE_LOG_ERROR("Stage {} failed for input {}: {}", stage::kLoadDataset,
                            store::DescribeTableInput(input), table.status().ToString());
        auto envelope = MakeErrorEnvelope(table.status(), stage::kLoadDataset);

        result.correlation.kpi_name = std::string(kpi);
        result.correlation.error = envelope;
        result.ranking.kpi_name = std::string(kpi);
        result.ranking.error = envelope;
        result.outliers.kpi = std::string(kpi);
        result.outliers.summary = SummarizeOutliers({});
        result.outliers.error = envelope;

        Persist(artifact::kCorrelationMatrix, result.correlation.ToJson());
        Persist(artifact::kImpactRanking, result.ranking.ToJson());
        Persist(artifact::kOutlierReport, result.outliers.ToJson());
        return result;
    }

    if (pool_) {
        // Correlation and outlier detection share nothing but the input table
        auto outlier_future = pool_->Submit(
            [this, &table, kpi]() { return DetectOutliers(*table, kpi); });
        auto correlation_future = pool_->Submit(
            [this, &table, kpi]() { return ComputeCorrelations(*table, kpi); });
        result.correlation = correlation_future.get();
        result.outliers = outlier_future.get();
    } else {
        result.correlation = ComputeCorrelations(*table, kpi);
        result.outliers = DetectOutliers(*table, kpi);
    }

    result.ranking = RankImpact(result.correlation);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    ROOTSCOPE_LOG_INFO(
        "Stats pipeline for '{}' finished in {}ms: {} driver(s) correlated, {} ranked, "
        "{} outlier(s){}",
        kpi, duration.count(), result.correlation.drivers.size(),
        result.ranking.ranking.size(), result.outliers.outliers.size(),
        result.HasError() ? " (with errors)" : "");
    return result;
}

// =============================================================================
// Stage boundaries
// =============================================================================

absl::StatusOr<std::vector<CorrelationRecord>> StatsService::RunCorrelation(
    const store::Table& table, std::string_view kpi) const {
    try {
        return correlation_engine_.Compute(table, kpi);
    } catch (const std::exception& e) {
        return InternalError(absl::StrCat("Correlation failed: ", e.what()));
    }
}

absl::StatusOr<std::vector<RankedDriver>> StatsService::RunRanking(
    const std::vector<CorrelationRecord>& records) const {
    try {
        return ranker_.Rank(records, config_.top_k);
    } catch (const std::exception& e) {
        return InternalError(absl::StrCat("Ranking failed: ", e.what()));
    }
}

absl::StatusOr<std::vector<OutlierPoint>> StatsService::RunOutliers(
    const store::Table& table, std::string_view kpi) const {
    try {
        return outlier_detector_.Detect(table, kpi);
    } catch (const std::exception& e) {
        return InternalError(absl::StrCat("Outlier detection failed: ", e.what()));
    }
}

void StatsService::Persist(std::string_view name, const json& record) {
    auto ref = store_.SaveRecord(std::string(name), record);
    if (!ref.ok()) {
        ROOTSCOPE_LOG_ERROR("Failed to persist {}: {}", name, ref.status().ToString());
        return;
    }
    ROOTSCOPE_LOG_INFO("Persisted {} v{}{}", name, ref->version,
                       HasErrorState(record) ? " (error envelope)" : "");
}

}  // namespace rootscope::analysis
