#ifndef MERGEFIX_H
#define MERGEFIX_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── status codes ────────────────────────────────────────────────── */

#define MERGEFIX_OK         0
#define MERGEFIX_ENOENT    -1   /* input path missing or not a file */
#define MERGEFIX_ELAYOUT   -2   /* layout JSON rejected */
#define MERGEFIX_EOPEN     -3   /* workbook could not be loaded */
#define MERGEFIX_EPROCESS  -4   /* engine failure outside a merge directive */
#define MERGEFIX_ESAVE     -5   /* workbook could not be saved */

/* ── struct types ────────────────────────────────────────────────── */

typedef struct {
    const char* path;            /* absolute path of the fixed file */
    int         status;          /* MERGEFIX_* */
    const char* error;           /* NULL on success */
    int         sheet_count;
    int         sheets_matched;
    int         block_count;
    int         merges_applied;
    int         merges_failed;
} mergefix_report;

typedef struct {
    uint32_t    sheet_index;     /* 0-based, workbook order */
    const char* title;
    int         matched;         /* 0 or 1 */
    int         block_count;
    int         merges_applied;
    int         merges_failed;
} mergefix_sheet;

typedef struct {
    uint32_t    sheet_index;
    const char* sheet;
    uint32_t    row;             /* 1-based first row of the range */
    const char* range;           /* "B7:E7" */
    const char* message;
} mergefix_warning;

/* ── fix ─────────────────────────────────────────────────────────── */
/*
 * Runs the whole repair on one file and saves it in place.
 *
 *   path         — .xlsx file to fix
 *   layout_json  — block layout document, or NULL for the built-in
 *                  report template layout
 *
 * Returns NULL only when path is NULL. Failures are reported through
 * mergefix_get_report()->status; the file is left untouched unless the
 * save stage was reached.
 */

typedef struct mergefix_result mergefix_result;

mergefix_result* mergefix_fix(const char* path, const char* layout_json);

/* Returns 0 on success, 1 on any failure. Nothing is reported. */
int mergefix_fix_file(const char* path);

/* Built-in layout, same schema mergefix_fix() accepts. */
const char* mergefix_default_layout_json(void);

/* report (single row, not an iterator) */
const mergefix_report*  mergefix_get_report(mergefix_result* result);
const char*             mergefix_get_report_json(mergefix_result* result);

/* sheet iterator */
const mergefix_sheet*   mergefix_next_sheet(mergefix_result* result);
const char*             mergefix_next_sheet_json(mergefix_result* result);

/* warning iterator */
const mergefix_warning* mergefix_next_warning(mergefix_result* result);
const char*             mergefix_next_warning_json(mergefix_result* result);

void mergefix_close(mergefix_result* result);

#ifdef __cplusplus
}
#endif

#endif
