#pragma once

// CloudConnect: in-process manager for heterogeneous cloud-like resources
//
// Resource types plug in through a registry; the manager enforces unique
// names and the create -> start -> stop -> delete lifecycle, and writes a
// per-resource audit trail.

// Core
#include "cloudconnect/types.hpp"
#include "cloudconnect/exceptions.hpp"
#include "cloudconnect/config.hpp"
#include "cloudconnect/field_bag.hpp"
#include "cloudconnect/resource.hpp"
#include "cloudconnect/resource_registry.hpp"
#include "cloudconnect/log_sink.hpp"
#include "cloudconnect/monitor.hpp"
#include "cloudconnect/resource_manager.hpp"

// Built-in resource types
#include "cloudconnect/resources/app_service.hpp"
#include "cloudconnect/resources/storage_account.hpp"
#include "cloudconnect/resources/cache_db.hpp"
