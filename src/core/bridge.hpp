/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: bridge.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Stable C ABI over conduit::Runtime for hosts written in another language.
 * All strings are NUL-terminated UTF-8. Payload pointers handed to the
 * callbacks are only valid for the duration of the callback.
 * ============================================================================
 */

#ifndef CONDUIT_BRIDGE_HPP
#define CONDUIT_BRIDGE_HPP

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct conduit_runtime conduit_runtime;
typedef struct conduit_plugin conduit_plugin;
typedef struct conduit_surface conduit_surface;

typedef void (*conduit_result_fn)(int64_t invocation_id, bool success, const char* payload);
typedef void (*conduit_channel_data_fn)(uint64_t channel_id, const char* payload);

// Creates a runtime configured from $CONDUIT_CONFIG. Never returns null.
conduit_runtime* conduit_runtime_create(void);

// Drains queued commands and destroys the runtime. Null is ignored.
void conduit_runtime_destroy(conduit_runtime* runtime);

// Releases a plugin box that was never registered.
void conduit_plugin_release(conduit_plugin* plugin);

// Takes ownership of plugin. surface may be null.
void conduit_register_plugin(
    conduit_runtime* runtime,
    const char* name,
    conduit_plugin* plugin,
    const char* config,
    conduit_surface* surface);

// owner is stored but never owned or dereferenced.
void conduit_surface_created(
    conduit_runtime* runtime,
    conduit_surface* surface,
    void* owner);

void conduit_run_plugin_command(
    conduit_runtime* runtime,
    int64_t invocation_id,
    const char* name,
    const char* command,
    const char* data,
    conduit_result_fn callback,
    conduit_channel_data_fn send_channel_data);

#ifdef __cplusplus
}
#endif

#endif // CONDUIT_BRIDGE_HPP
