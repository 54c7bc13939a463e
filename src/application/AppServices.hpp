/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/AutopilotService.hpp"
#include "application/MovementPlanService.hpp"
#include "application/PatternLearningService.hpp"
#include "application/PlanSyncService.hpp"
#include "application/ScheduleService.hpp"
#include "application/StreakService.hpp"
#include "domain/ActivityDataProvider.hpp"
#include "domain/CalendarProvider.hpp"
#include "infrastructure/JsonFileStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace moveslot::application {

struct AppServices {
    std::shared_ptr<domain::CalendarProvider> calendar;
    std::shared_ptr<domain::ActivityDataProvider> activityData;
    std::shared_ptr<infrastructure::JsonFileStore> store;
    std::shared_ptr<PatternLearningService> learningService;
    std::unique_ptr<MovementPlanService> planService;
    std::unique_ptr<AutopilotService> autopilotService;
    std::unique_ptr<StreakService> streakService;
    std::unique_ptr<ScheduleService> scheduleService;
    std::unique_ptr<PlanSyncService> syncService;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace moveslot::application
