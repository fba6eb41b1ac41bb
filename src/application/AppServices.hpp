/**
 * @file AppServices.hpp
 * @brief Container for the services behind the command surface, to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "domain/TranscriptionService.hpp"
#include "domain/SummarizationService.hpp"
#include "domain/RecordingStore.hpp"
#include "application/AsyncTaskManager.hpp"

namespace localscribe::application {

struct AppServices {
    std::shared_ptr<domain::TranscriptionService> transcriptionService;
    std::shared_ptr<domain::SummarizationService> summarizationService;
    std::shared_ptr<domain::RecordingStore> recordingStore;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace localscribe::application
