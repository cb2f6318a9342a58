#pragma once

/*
 * Flat C ABI of the ferry boundary library.
 *
 * Ownership rules:
 * - Every FerryCVec, FerryUuid4 and `const char*` returned by this API is owned
 *   by the caller and must be released exactly once with its paired release
 *   function (FerryCVecDrop, FerryUuid4Drop, FerryCstrDrop).
 * - Releasing twice, or reading after release, is undefined.
 * - Pointer parameters are assumed valid unless documented as checked. A
 *   checked pointer that is null aborts the process with a diagnostic naming
 *   the function. Nothing unwinds across this boundary.
 */

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Opaque reference-counted immutable string backing a FerryUuid4. */
typedef struct FerryArcString FerryArcString;

/*
 * Transferable descriptor of a native heap buffer.
 *
 * `ptr` is null only for the canonical empty vector. `cap` is the allocation
 * size in elements and is what release uses; `len <= cap` always holds.
 * Changing any field after it was produced is undefined.
 */
typedef struct FerryCVec {
  void* ptr;
  uintptr_t len;
  uintptr_t cap;
} FerryCVec;

/* One shared reference to an identifier's canonical text. */
typedef struct FerryUuid4 {
  FerryArcString* value;
} FerryUuid4;

/* ---- Opaque vector handle ---------------------------------------------- */

/* Returns the canonical empty vector {NULL, 0, 0}. Not an allocation. */
FerryCVec FerryCVecNew(void);

/*
 * Releases the buffer. No-op for the empty vector. Aborts if len > cap or if
 * the pointer and capacity disagree about being empty.
 */
void FerryCVecDrop(FerryCVec cvec);

/* ---- C strings --------------------------------------------------------- */

/*
 * Releases a string returned by this library. Aborts on NULL.
 * Calling twice on the same pointer is undefined.
 */
void FerryCstrDrop(const char* ptr);

/*
 * Returns the number of decimal places in a numeral: digits following the
 * first '.', or the exponent of an "e-N" suffix. Returns 0 when there is no
 * fractional part. Aborts on NULL.
 */
uint8_t FerryPrecisionFromCstr(const char* ptr);

/* ---- Time units -------------------------------------------------------- */

/*
 * Fractional inputs are rounded half away from zero. Negative, NaN or
 * infinite inputs, and results that overflow uint64_t, abort.
 */
uint64_t FerrySecsToNanos(double secs);
uint64_t FerrySecsToMillis(double secs);
uint64_t FerryMinsToNanos(double mins);

/* Exact integer multiplication. Overflow aborts. */
uint64_t FerryMillisToNanos(uint64_t millis);
uint64_t FerryMicrosToNanos(uint64_t micros);

/* Integer results truncate toward zero. */
double FerryNanosToSecs(uint64_t nanos);
uint64_t FerryNanosToMillis(uint64_t nanos);
uint64_t FerryNanosToMicros(uint64_t nanos);

/* Wall-clock time since the UNIX epoch. Not monotonic across clock changes. */
double FerryUnixTimestamp(void);
uint64_t FerryUnixTimestampMs(void);
uint64_t FerryUnixTimestampUs(void);
uint64_t FerryUnixTimestampNs(void);

/*
 * Formats UNIX nanoseconds as "YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ".
 * Release the result with FerryCstrDrop.
 */
const char* FerryUnixNanosToIso8601(uint64_t nanos);

/* ---- Shared identifier ------------------------------------------------- */

/* Fresh random version-4 identifier. Reference count starts at 1. */
FerryUuid4 FerryUuid4New(void);

/* Shares the backing string of `uuid4`. O(1), no allocation. */
FerryUuid4 FerryUuid4Clone(const FerryUuid4* uuid4);

/* Releases one reference. The backing string is freed by the last release. */
void FerryUuid4Drop(FerryUuid4 uuid4);

/*
 * Parses an identifier (hyphenated, simple, braced or urn form, any case)
 * into canonical lowercase hyphenated form. Aborts on NULL or malformed text.
 * The input is copied, never retained.
 */
FerryUuid4 FerryUuid4FromCstr(const char* ptr);

/* Canonical text of `uuid`. Release the result with FerryCstrDrop. */
const char* FerryUuid4ToCstr(const FerryUuid4* uuid);

/* 1 when both identifiers have the same text, else 0. */
uint8_t FerryUuid4Eq(const FerryUuid4* lhs, const FerryUuid4* rhs);

/* Stable 64-bit hash of the canonical text. Equal identifiers hash equal. */
uint64_t FerryUuid4Hash(const FerryUuid4* uuid);

#ifdef __cplusplus
}  // extern "C"
#endif
