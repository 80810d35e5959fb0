// ═══════════════════════════════════════════════════════════════════
//  intelgate/core.h: Layer core (requires libintelgate_core.a)
//
//  Loaders, cache, pub/sub and admission, without the network front end.
//  Link with -lintelgate_core -luring -lssl -lcrypto -lluajit
// ═══════════════════════════════════════════════════════════════════
#pragma once

#ifndef __linux__
#  error "intelgate requires Linux (io_uring)"
#endif

#include "intelgate/shared/logging.h"
#include "intelgate/shared/clock.h"
#include "intelgate/shared/auth_context.h"
#include "intelgate/store/kv_store.h"
#include "intelgate/store/memory_kv_store.h"
#include "intelgate/store/resp_kv_store.h"
#include "intelgate/cache/cache_manager.h"
#include "intelgate/loader/entity_source.h"
#include "intelgate/loader/memory_entity_source.h"
#include "intelgate/loader/script_entity_source.h"
#include "intelgate/loader/request_scope.h"
#include "intelgate/events/event_bus.h"
#include "intelgate/events/predicates.h"
#include "intelgate/events/subscription_router.h"
#include "intelgate/admission/admission_controller.h"
