#pragma once

#include "core/ipc/service_base.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <memory>

namespace gf {

class AdmissionQueue;
class FeatureExtractionStage;
class GenerationBackend;
class HnswIndexClient;
class ImageStorage;
class JobStore;
class MatchingStage;
class ModelRegistry;
class OnnxRegionEmbedder;
class Orchestrator;
class RegionDetector;
class StyleGenerationStage;

class MatcherService : public ServiceBase {
    Q_OBJECT
public:
    explicit MatcherService(QObject* parent = nullptr);
    ~MatcherService() override;

protected:
    bool prepare() override;
    void teardown() override;

private:
    QJsonObject handleSubmit(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetStatus(uint64_t id, const QJsonObject& params);
    QJsonObject handleCancel(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetStats(uint64_t id);
    QJsonObject handlePurgeExpired(uint64_t id);

    static QJsonObject stageErrorReply(uint64_t id, const StageError& error);

    Settings m_settings;

    // Owned components, declared in dependency order.
    std::unique_ptr<JobStore> m_store;
    std::unique_ptr<ImageStorage> m_storage;
    std::unique_ptr<GenerationBackend> m_generationBackend;
    std::unique_ptr<StyleGenerationStage> m_generation;
    std::unique_ptr<RegionDetector> m_detector;
    std::unique_ptr<ModelRegistry> m_models;
    std::unique_ptr<OnnxRegionEmbedder> m_embedder;
    std::unique_ptr<FeatureExtractionStage> m_extraction;
    std::unique_ptr<HnswIndexClient> m_index;
    std::unique_ptr<MatchingStage> m_matching;
    std::unique_ptr<AdmissionQueue> m_admission;
    std::unique_ptr<Orchestrator> m_orchestrator;
};

} // namespace gf
