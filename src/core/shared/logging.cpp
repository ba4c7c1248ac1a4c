#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(gfCore, "ghurfati.core")
Q_LOGGING_CATEGORY(gfPipeline, "ghurfati.pipeline")
Q_LOGGING_CATEGORY(gfGeneration, "ghurfati.generation")
Q_LOGGING_CATEGORY(gfExtraction, "ghurfati.extraction")
Q_LOGGING_CATEGORY(gfMatching, "ghurfati.matching")
Q_LOGGING_CATEGORY(gfIndex, "ghurfati.index")
Q_LOGGING_CATEGORY(gfIpc, "ghurfati.ipc")
