#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace gf {

struct Settings {
    // Storage. Empty paths are resolved against the data directory at startup.
    QString dataDir;
    QString dbPath;
    QString imageRoot;

    // Style generation
    QString generatorCommand;
    QStringList generatorArgs;
    int generationTimeoutMs = 120000;

    // Feature extraction
    QString detectorCommand;
    QStringList detectorArgs;
    int extractionTimeoutMs = 60000;
    double minDetectionScore = 0.3;
    int maxRegions = 16;
    bool embeddingEnabled = true;            // ONNX encoder for regions without embeddings
    QString modelsDir;

    // Vector index
    QString indexPath;
    QString indexMetaPath;
    QString catalogDbPath;
    int embeddingDimensions = 512;
    int indexEfSearch = 64;
    int indexQueryTimeoutMs = 2000;
    int catalogPoolSize = 4;
    int catalogAcquireTimeoutMs = 1000;

    // Matching
    int matchK = 5;
    int overfetchFactor = 4;
    double categoryMismatchPenalty = 0.7;
    double ambiguousHintScore = 0.5;         // hints below this detection score are soft
    int perJobMatchConcurrency = 4;

    // Orchestration
    int admissionCapacity = 64;
    int generationSlots = 1;
    int workerCount = 4;
    int retryMaxAttempts = 3;
    int retryBaseDelayMs = 200;
    double retryMultiplier = 2.0;
    int retryMaxDelayMs = 5000;
    int retentionDays = 30;
};

} // namespace gf
