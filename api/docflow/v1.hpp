#pragma once

#include "docflow/v1/workflow.pb.h"
#include "docflow/v1/workflow_service.pb.h"
