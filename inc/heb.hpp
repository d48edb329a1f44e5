//SPDX-License-Identifier: MIT
#ifndef HERMES_ENVIRONMENT_BRIDGE
#define HERMES_ENVIRONMENT_BRIDGE

#include "utility.hpp"
#include "logging.hpp"
#include "service.hpp"
#include "atomic.hpp"
#include "cleanup.hpp"
#include "error.hpp"
#include "context.hpp"
#include "coroutine.hpp"
#include "future.hpp"
#include "native.hpp"
#include "local_runtime.hpp"
#include "store.hpp"
#include "hospice.hpp"
#include "policy.hpp"
#include "event_loop.hpp"
#include "scheduler.hpp"
#include "nursery.hpp"
#include "adapters.hpp"
#include "unified.hpp"
#include "prefetch.hpp"
#include "testing.hpp"
#include "lifecycle.hpp"

#endif
