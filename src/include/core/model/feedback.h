#pragma once

#include "feedback/feedback.h"
#include "feedback/feedback_type.h"
#include "feedback/task_started.h"
#include "feedback/task_updated.h"
#include "feedback/upload_completed.h"
