#pragma once
#include <weft/core/errors.h>
#include <weft/core/diagnostics.h>
#include <weft/core/unit.h>
#include <weft/dom/document.h>
#include <weft/dom/dom_adapter.h>
#include <weft/effect/runtime.h>
#include <weft/effect/scope.h>
#include <weft/mount/alternative.h>
#include <weft/mount/children.h>
#include <weft/mount/element.h>
#include <weft/mount/events.h>
#include <weft/mount/modifier.h>
#include <weft/mount/mount.h>
#include <weft/platform/event_loop.h>
#include <weft/platform/thread_pool.h>
#include <weft/stream/hub.h>
#include <weft/stream/signal.h>
