#pragma once

#include "core/generation/generation_backend.h"

#include <QStringList>

namespace gf {

// Runs an external generator once per request. Arguments may use the
// placeholders {input}, {output}, {style}, {strength} and {room}; the full
// request is also written to stdin as JSON.
//
// Exit codes: 0 success, 2 invalid parameters, 75 temporarily unavailable,
// anything else a transient failure.
class ProcessGenerationBackend : public GenerationBackend {
public:
    static constexpr int kExitInvalidParams = 2;
    static constexpr int kExitUnavailable = 75;

    ProcessGenerationBackend(const QString& command, const QStringList& args);

    std::optional<StageError> generate(const GenerationRequest& request) override;

private:
    QString m_command;
    QStringList m_args;
};

} // namespace gf
