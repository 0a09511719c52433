/* Flat C surface for position identifiers.
 *
 * Identifiers live in a process-wide table inside the library and are named by
 * opaque 64-bit handles. Handle 0 is never valid. Every call records its
 * outcome in a thread-local slot read by tradeid_last_error().
 */
#ifndef TRADEID_C_API_POSITION_ID_H
#define TRADEID_C_API_POSITION_ID_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#  if defined(TRADEID_BUILDING)
#    define TRADEID_API __declspec(dllexport)
#  else
#    define TRADEID_API __declspec(dllimport)
#  endif
#else
#  define TRADEID_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

typedef uint64_t tradeid_position_id_t;

#define TRADEID_POSITION_ID_INVALID ((tradeid_position_id_t)0)

/* Values mirror tradeid::core::IdentifierErrc */
enum {
    TRADEID_OK = 0,
    TRADEID_ERR_NULL_ARGUMENT = 1,
    TRADEID_ERR_INVALID_TEXT = 2,
    TRADEID_ERR_INVALID_HANDLE = 3,
    TRADEID_ERR_CAPACITY_EXCEEDED = 4,
    TRADEID_ERR_OUT_OF_MEMORY = 5,
    TRADEID_ERR_CONFIG_NOT_FOUND = 6,
    TRADEID_ERR_CONFIG_CORRUPTION = 7,
    TRADEID_ERR_UNKNOWN = 8
};

/* Destroys the identifier. After this the handle is dead for good; freeing it
 * again sets TRADEID_ERR_INVALID_HANDLE. */
TRADEID_API void tradeid_position_id_free(tradeid_position_id_t position_id);

/* Copies `ptr` (NUL-terminated UTF-8) into a new identifier.
 * Returns TRADEID_POSITION_ID_INVALID on error. */
TRADEID_API tradeid_position_id_t tradeid_position_id_from_cstr(const char* ptr);

/* Borrowed: do not free. Valid until tradeid_position_id_free(position_id).
 * NULL on an invalid handle. */
TRADEID_API const char* tradeid_position_id_to_cstr(tradeid_position_id_t position_id);

/* 1 if both identifiers hold the same text, else 0 (also 0 on error). */
TRADEID_API uint8_t tradeid_position_id_eq(tradeid_position_id_t lhs, tradeid_position_id_t rhs);

/* Process-local hash; do not persist or transmit. 0 on error. */
TRADEID_API uint64_t tradeid_position_id_hash(tradeid_position_id_t position_id);

TRADEID_API size_t tradeid_position_id_live_count(void);

TRADEID_API int32_t tradeid_last_error(void);
TRADEID_API const char* tradeid_error_message(int32_t code);

/* Loads a JSON manifest and applies its logging and boundary sections. */
TRADEID_API int32_t tradeid_configure(const char* manifest_path);

#ifdef __cplusplus
}
#endif

#endif /* TRADEID_C_API_POSITION_ID_H */
