#pragma once

#include "model/cancel_upload.h"
#include "model/modify_settings.h"
#include "model/operation.h"
#include "model/operation_type.h"
#include "model/start_upload.h"
