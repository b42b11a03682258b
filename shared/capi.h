#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// Most ilweave API calls also require the result to be used in some way.
#define ILWEAVE_C_EXPORT __attribute__((visibility("default"))) __attribute__((warn_unused_result))
#define ILWEAVE_C_EXPORT_VOID __attribute__((visibility("default")))
// The ilweave C API

#ifdef __cplusplus
extern "C" {
#endif

/// @brief The patch result types
typedef enum {
  ILWEAVE_PATCH_OK,
  ILWEAVE_PATCH_TYPE_NOT_FOUND,
  ILWEAVE_PATCH_METHOD_NOT_FOUND,
  ILWEAVE_PATCH_NO_BODY,
  ILWEAVE_PATCH_OFFSET_MAPPING_ERROR,
  ILWEAVE_PATCH_UNSUPPORTED_BODY,
  ILWEAVE_PATCH_UNSUPPORTED_RETURN,
  ILWEAVE_PATCH_BODY_TOO_LARGE,
  ILWEAVE_PATCH_OPEN_ERROR,
  ILWEAVE_PATCH_IO_ERROR,
} IlweavePatchResultType;

/// @brief Opaque pointer around an ilweave::patching::Error
typedef struct IlweavePatchErrorData IlweavePatchErrorData;

/// @brief Describes a successful patch.
typedef struct {
  /// @brief The file offset of the replaced body header.
  uint32_t file_offset;
  /// @brief The number of bytes rewritten (header and code of the original body).
  uint32_t span;
  /// @brief The number of bytes of the synthesized body; the remainder of the span is zero filled.
  uint32_t encoded_size;
} IlweavePatchInfo;

/// @brief Returned from a patch.
/// The info of the union is legal only when result == ILWEAVE_PATCH_OK, otherwise it holds an error.
/// The error can be formatted to a string using ilweave_format_error. The lifetime of the error data is until
/// ilweave_format_error or ilweave_free_error is called.
typedef struct {
  IlweavePatchResultType result;
  union {
    IlweavePatchInfo info;
    IlweavePatchErrorData* data;
  } value;
} IlweavePatchResult;

/// @brief Reads the module at module_path, replaces the body of type_name::method_name with a body returning the
/// default value of its return type, and writes the whole module to output_path. Parent directories of output_path are
/// created as needed. Nothing is written on failure.
/// @param module_path The module to read.
/// @param output_path Where to write the patched module. May equal module_path.
/// @param type_name The qualified name of the declaring type (Namespace.Name).
/// @param method_name The method name. The first declared overload is patched.
ILWEAVE_C_EXPORT IlweavePatchResult ilweave_patch_method(char const* module_path, char const* output_path,
                                                         char const* type_name, char const* method_name);

/// @brief Given a patch error, formats a human-readable error message and writes it to the provided string, not
/// exceeding the size provided. The error is CONSUMED by this call.
ILWEAVE_C_EXPORT_VOID void ilweave_format_error(IlweavePatchErrorData* error, char* buffer, size_t buffer_size);

/// @brief Frees a patch error without formatting it.
ILWEAVE_C_EXPORT_VOID void ilweave_free_error(IlweavePatchErrorData* error);

#ifdef __cplusplus
}
#endif
