#pragma once

/// @file stats_service.h
/// @brief Error-safe boundary around the statistics stages
///
/// Provides a service that:
/// - Runs correlation, ranking and outlier detection on a resolved table
/// - Converts any failure into an error envelope on an empty result
/// - Persists every result under its standard artifact name
/// - Optionally runs the two independent stages concurrently

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "analysis/correlation_engine.h"
#include "analysis/driver_metadata.h"
#include "analysis/impact_ranker.h"
#include "analysis/outlier_detector.h"
#include "analysis/types.h"
#include "common/config.h"
#include "common/thread_pool.h"
#include "store/artifact_store.h"
#include "store/table_input.h"

namespace rootscope::analysis {

/// @brief Standard artifact names
namespace artifact {
inline constexpr std::string_view kUnifiedDataset = "unified_dataset";
inline constexpr std::string_view kCorrelationMatrix = "correlation_matrix";
inline constexpr std::string_view kImpactRanking = "impact_ranking";
inline constexpr std::string_view kOutlierReport = "outlier_report";
}  // namespace artifact

/// @brief Configuration for the stats service
struct StatsServiceConfig {
    /// Where sessions are created
    store::ArtifactStoreConfig store;

    /// Ranking truncation, nullopt keeps every driver
    std::optional<size_t> top_k = 10;

    /// Run correlation and outlier detection concurrently
    bool parallel_branches = true;

    /// Driver metadata JSON, empty disables enrichment
    std::string metadata_path;

    CorrelationEngineConfig correlation;
    ImpactRankerConfig ranker;
    OutlierDetectorConfig outliers;

    /// @brief Read store.base_dir, analysis.top_k, analysis.parallel_branches
    ///        and metadata.path
    static absl::StatusOr<StatsServiceConfig> FromConfig(const Config& config);
};

/// @brief The three results of one pipeline run
struct PipelineResult {
    CorrelationResult correlation;
    RankingResult ranking;
    OutlierResult outliers;

    /// Set when the input was resolved and persisted
    std::optional<store::ArtifactRef> dataset_ref;

    bool HasError() const {
        return correlation.HasError() || ranking.HasError() || outliers.HasError();
    }
};

/// @brief Runs the statistics stages against one session's artifact store
///
/// Every public operation returns a structurally valid result. A failed
/// stage yields its empty collection with an ErrorEnvelope attached, and
/// that result is still persisted under the name a successful run would use.
///
/// Example usage:
/// @code
///   auto store = store::ArtifactStore::StartSession(config.store);
///   StatsService service(**store, config);
///   auto result = service.RunPipeline(store::RawCsv{csv_text}, "KPI");
///   if (result.ranking.HasError()) {
///       std::cout << FormatErrorForUser(*result.ranking.error);
///   }
/// @endcode
class StatsService {
public:
    StatsService(store::ArtifactStore& store,
                 StatsServiceConfig config = {},
                 std::shared_ptr<const DriverMetadataProvider> metadata = nullptr);
    ~StatsService();

    // Disable copy
    StatsService(const StatsService&) = delete;
    StatsService& operator=(const StatsService&) = delete;

    /// @brief Correlate drivers with the KPI and save "correlation_matrix"
    CorrelationResult ComputeCorrelations(const store::Table& table, std::string_view kpi);

    /// @brief Rank a correlation result and save "impact_ranking"
    ///
    /// An upstream envelope is forwarded unchanged onto an empty ranking.
    RankingResult RankImpact(const CorrelationResult& correlation);

    /// @brief Flag outliers and save "outlier_report"
    OutlierResult DetectOutliers(const store::Table& table, std::string_view kpi);

    /// @brief Resolve the input, save "unified_dataset" and run all stages
    PipelineResult RunPipeline(const store::TableInput& input, std::string_view kpi);

    /// @brief Provider from metadata_path; nullptr when unset or missing
    static absl::StatusOr<std::shared_ptr<const DriverMetadataProvider>> LoadMetadata(
        const StatsServiceConfig& config);

    const StatsServiceConfig& GetConfig() const { return config_; }

private:
    absl::StatusOr<std::vector<CorrelationRecord>> RunCorrelation(
        const store::Table& table, std::string_view kpi) const;
    absl::StatusOr<std::vector<RankedDriver>> RunRanking(
        const std::vector<CorrelationRecord>& records) const;
    absl::StatusOr<std::vector<OutlierPoint>> RunOutliers(
        const store::Table& table, std::string_view kpi) const;

    /// @brief Save a result record, logging instead of failing
    void Persist(std::string_view name, const nlohmann::json& record);

    store::ArtifactStore& store_;
    StatsServiceConfig config_;

    CorrelationEngine correlation_engine_;
    ImpactRanker ranker_;
    OutlierDetector outlier_detector_;

    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace rootscope::analysis
