/* C interface of the SODA speech recognition engine.
 *
 * Two generations of the entry points exist. The original one takes a
 * fixed-layout config and reports plain text; the extended one takes a
 * serialized config record and reports serialized responses. Both report
 * results asynchronously from engine-owned threads.
 */
#ifndef SODA_API_H_
#define SODA_API_H_

#ifdef __cplusplus
extern "C" {
#else
#include <stdbool.h>
#endif

/* Called on a recognition event with the transcribed text, whether the
 * result is final, and the callback_handle given at creation. */
typedef void (*RecognitionResultHandler)(const char*, const bool, void*);

typedef struct {
    /* Fixed for the lifetime of the instance. */
    int channel_count;
    int sample_rate;

    /* Fully-qualified path to the language pack. */
    const char* language_pack_directory;

    RecognitionResultHandler callback;

    /* Passed back to callback untouched. Ownership is not taken. */
    void* callback_handle;

    /* Key used to verify the caller. */
    const char* api_key;
} SodaConfig;

/* Called with a serialized response record of the given size. */
typedef void (*SerializedSodaResultHandler)(const char*, int, void*);

typedef struct {
    /* Serialized config record; only read during the create call. */
    const char* soda_config;
    int soda_config_size;

    SerializedSodaResultHandler callback;
    void* callback_handle;
} SerializedSodaConfig;

typedef void* (*CreateSodaAsyncFn)(SodaConfig);
typedef void (*DeleteSodaAsyncFn)(void*);
typedef void (*AddAudioFn)(void*, const char*, int);

typedef void* (*CreateExtendedSodaAsyncFn)(SerializedSodaConfig);
typedef void (*DeleteExtendedSodaAsyncFn)(void*);
typedef void (*ExtendedAddAudioFn)(void*, const char*, int);
typedef void (*ExtendedSodaStartFn)(void*);

#ifdef __cplusplus
}
#endif

#endif /* SODA_API_H_ */
