/**
 * SCFW Verifier Plugin ABI
 *
 * A verifier plugin is a shared library exporting scfw_load_verifier().
 * Targets and findings cross the boundary as JSON text so that plugins may
 * be written in C or any language with a C FFI.
 *
 * targets_json:   [{"ecosystem": "npm"|"PyPI", "name": "...", "version": "..."}]
 * findings_json:  [{"ecosystem", "name", "version",
 *                   "severity": "WARNING"|"CRITICAL", "message", "detail"?}]
 *
 * verify() returns 0 on success. A nonzero return is a recoverable failure;
 * *findings_json then optionally holds an error message. Strings returned
 * through findings_json are released with free_string().
 */

#ifndef SCFW_VERIFIER_PLUGIN_H
#define SCFW_VERIFIER_PLUGIN_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define SCFW_VERIFIER_ABI_VERSION 1
#define SCFW_VERIFIER_ENTRY_SYMBOL "scfw_load_verifier"

typedef struct scfw_verifier_plugin {
    uint32_t abi_version;
    const char* name;
    int (*verify)(const char* targets_json, char** findings_json);
    void (*free_string)(char* s);
} scfw_verifier_plugin;

typedef const scfw_verifier_plugin* (*scfw_load_verifier_fn)(void);

#if defined(_WIN32)
#define SCFW_PLUGIN_EXPORT __declspec(dllexport)
#else
#define SCFW_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
}
#endif

#endif /* SCFW_VERIFIER_PLUGIN_H */
