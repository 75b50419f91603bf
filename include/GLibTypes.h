#pragma once

#include <glib.h>
#include <memory>

namespace hapble {

/**
 * @brief RAII wrappers around the GLib resources used by the watcher and configuration code
 */

//
// 1. Resource deleters for use with smart pointers
//

/**
 * @brief Custom deleter for GSource
 *
 * Destroys the source (detaching it from its context) before dropping our reference, so a pending
 * timeout never outlives its owner.
 */
struct GSourceDeleter {
    void operator()(GSource* ptr) const {
        if (ptr) {
            g_source_destroy(ptr);
            g_source_unref(ptr);
        }
    }
};

/**
 * @brief Custom deleter for GMainContext
 */
struct GMainContextDeleter {
    void operator()(GMainContext* ptr) const {
        if (ptr) g_main_context_unref(ptr);
    }
};

/**
 * @brief Custom deleter for GMainLoop
 */
struct GMainLoopDeleter {
    void operator()(GMainLoop* ptr) const {
        if (ptr) g_main_loop_unref(ptr);
    }
};

/**
 * @brief Custom deleter for GError
 */
struct GErrorDeleter {
    void operator()(GError* ptr) const {
        if (ptr) g_error_free(ptr);
    }
};

/**
 * @brief Custom deleter for GKeyFile
 */
struct GKeyFileDeleter {
    void operator()(GKeyFile* ptr) const {
        if (ptr) g_key_file_unref(ptr);
    }
};

/**
 * @brief Custom deleter for memory returned by g_malloc (gchar*, guchar*)
 */
struct GFreeDeleter {
    void operator()(void* ptr) const {
        g_free(ptr);
    }
};

//
// 2. Smart pointer type definitions
//

using GSourcePtr = std::unique_ptr<GSource, GSourceDeleter>;
using GMainContextPtr = std::unique_ptr<GMainContext, GMainContextDeleter>;
using GMainLoopPtr = std::unique_ptr<GMainLoop, GMainLoopDeleter>;
using GErrorPtr = std::unique_ptr<GError, GErrorDeleter>;
using GKeyFilePtr = std::unique_ptr<GKeyFile, GKeyFileDeleter>;
using GCharPtr = std::unique_ptr<gchar, GFreeDeleter>;
using GUCharPtr = std::unique_ptr<guchar, GFreeDeleter>;

//
// 3. Helpers
//

/**
 * @brief Take an additional reference on a GMainContext
 *
 * @param context Context to reference, or nullptr for the thread-default context
 * @return Smart pointer owning the new reference
 */
inline GMainContextPtr refGMainContext(GMainContext* context) {
    if (!context) {
        context = g_main_context_ref_thread_default();
        return GMainContextPtr(context);
    }
    return GMainContextPtr(g_main_context_ref(context));
}

} // namespace hapble
