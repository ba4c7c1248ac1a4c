#pragma once

#include "core/extraction/region_detector.h"

#include <QByteArray>
#include <QStringList>

namespace gf {

// Runs an external detector (argument placeholder {input}) that prints
//   {"regions":[{"box":[x,y,w,h],"category":"sofa","score":0.93,"embedding":[...]}]}
// with boxes normalized to the image. Exit code 3 means the image could not
// be decoded, 75 that the detector is temporarily unavailable.
class ProcessRegionDetector : public RegionDetector {
public:
    static constexpr int kExitUnreadableImage = 3;
    static constexpr int kExitUnavailable = 75;

    ProcessRegionDetector(const QString& command, const QStringList& args, int timeoutMs);

    StageResult<std::vector<DetectedRegion>> detect(const QString& imagePath) override;

    // Parses detector stdout. Malformed entries are skipped; a malformed
    // document fails Transient.
    static StageResult<std::vector<DetectedRegion>> parseOutput(const QByteArray& output);

private:
    QString m_command;
    QStringList m_args;
    int m_timeoutMs = 0;
};

} // namespace gf
