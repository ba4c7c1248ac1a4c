#include "core/models/model_session.h"

#include "core/shared/logging.h"

#include <QFile>

#include <algorithm>
#include <onnxruntime_cxx_api.h>

namespace gf {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "ghurfati-models");
    return env;
}

bool containsName(const std::vector<std::string>& names, const QString& wanted)
{
    return std::find(names.begin(), names.end(), wanted.toStdString()) != names.end();
}

size_t indexOf(const std::vector<std::string>& names, const std::string& name)
{
    return static_cast<size_t>(std::find(names.begin(), names.end(), name) - names.begin());
}

} // namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions options;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(const ModelManifestEntry& manifest)
    : m_impl(std::make_unique<Impl>())
    , m_manifest(manifest)
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::initialize(const QString& modelPath)
{
    m_available = false;
    m_inputNames.clear();
    m_outputNames.clear();

    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        LOG_WARN(gfCore, "ModelSession: '%s' has no model file at %s",
                 qPrintable(m_manifest.name), qPrintable(modelPath));
        return false;
    }

    try {
        m_impl->options.SetIntraOpNumThreads(std::max(1, m_manifest.intraOpThreads));
        m_impl->options.SetInterOpNumThreads(1);
        m_impl->options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->options);

        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < m_impl->session->GetInputCount(); ++i) {
            m_inputNames.emplace_back(m_impl->session->GetInputNameAllocated(i, allocator).get());
        }
        for (size_t i = 0; i < m_impl->session->GetOutputCount(); ++i) {
            m_outputNames.emplace_back(m_impl->session->GetOutputNameAllocated(i, allocator).get());
        }

        if (!checkEncoderGraph()) {
            m_impl->session.reset();
            return false;
        }
    } catch (const Ort::Exception& ex) {
        LOG_WARN(gfCore, "ModelSession: '%s' failed to load: %s", qPrintable(m_manifest.name),
                 ex.what());
        m_impl->session.reset();
        return false;
    }

    LOG_INFO(gfCore, "ModelSession: '%s' ready (%dpx in, %d dims out)",
             qPrintable(m_manifest.name), m_manifest.imageSize, m_manifest.dimensions);
    m_available = true;
    return true;
}

// The graph must take one NCHW float image batch with three channels and
// produce embeddings of the declared width. Dynamic axes (-1) are accepted.
bool ModelSession::checkEncoderGraph() const
{
    if (m_inputNames.empty() || m_outputNames.empty()) {
        LOG_WARN(gfCore, "ModelSession: '%s' exposes no inputs or outputs",
                 qPrintable(m_manifest.name));
        return false;
    }
    for (const QString& input : m_manifest.inputs) {
        if (!containsName(m_inputNames, input)) {
            LOG_WARN(gfCore, "ModelSession: '%s' lacks input '%s'", qPrintable(m_manifest.name),
                     qPrintable(input));
            return false;
        }
    }
    for (const QString& output : m_manifest.outputs) {
        if (!containsName(m_outputNames, output)) {
            LOG_WARN(gfCore, "ModelSession: '%s' lacks output '%s'", qPrintable(m_manifest.name),
                     qPrintable(output));
            return false;
        }
    }

    const std::string& inputName =
        m_manifest.inputs.empty() ? m_inputNames.front() : m_manifest.inputs.front().toStdString();
    const std::vector<int64_t> inputShape = m_impl->session->GetInputTypeInfo(
        indexOf(m_inputNames, inputName)).GetTensorTypeAndShapeInfo().GetShape();
    if (inputShape.size() != 4 || (inputShape[1] != -1 && inputShape[1] != 3)) {
        LOG_WARN(gfCore, "ModelSession: '%s' input is not a 3-channel NCHW image batch",
                 qPrintable(m_manifest.name));
        return false;
    }

    const std::string& outputName = m_manifest.outputs.empty()
        ? m_outputNames.front()
        : m_manifest.outputs.front().toStdString();
    const std::vector<int64_t> outputShape = m_impl->session->GetOutputTypeInfo(
        indexOf(m_outputNames, outputName)).GetTensorTypeAndShapeInfo().GetShape();
    if (outputShape.empty()) {
        LOG_WARN(gfCore, "ModelSession: '%s' output has no shape", qPrintable(m_manifest.name));
        return false;
    }
    const int64_t width = outputShape.back();
    if (width != -1 && width != m_manifest.dimensions) {
        LOG_WARN(gfCore, "ModelSession: '%s' emits %lld dims, manifest declares %d",
                 qPrintable(m_manifest.name), static_cast<long long>(width),
                 m_manifest.dimensions);
        return false;
    }
    return true;
}

Ort::Session* ModelSession::session() const
{
    return m_impl->session.get();
}

} // namespace gf
