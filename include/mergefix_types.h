#ifndef MERGEFIX_TYPES_H
#define MERGEFIX_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

/* ── Block layout ──────────────────────────────────────────────── */

/* sheet limits of the xlsx format */
const uint32_t kSheetMaxRow    = 1048576;
const uint32_t kSheetMaxColumn = 16384;

/* Rectangle relative to a block's first row; columns are 1-based. */
struct MergeDirective {
    uint32_t row;        /* row offset from the block's first row */
    uint32_t col;
    uint32_t last_row;   /* row offset, >= row */
    uint32_t last_col;   /* >= col */
};

struct BlockLayout {
    std::string sheet_pattern;
    uint32_t    first_row;
    uint32_t    stride;
    uint32_t    marker_column;
    std::vector<MergeDirective> merges;
};

/* Layout of the generated performance report template. */
BlockLayout default_layout();

/* Keys missing from the document keep their default_layout() value.
   Returns false and fills err on malformed or out-of-range input. */
bool layout_from_json(const std::string& text, BlockLayout& out, std::string& err);

std::string layout_to_json(const BlockLayout& layout);

/* Case-insensitive wildcard match: '*' any run, '?' one character. */
bool sheet_matches(const std::string& pattern, const std::string& title);

/* ── Fix result (produced by the backend) ──────────────────────── */

struct MergeWarning {
    uint32_t    sheet_index;
    std::string sheet;
    uint32_t    row;
    std::string range;
    std::string message;
};

struct SheetResult {
    uint32_t    sheet_index;
    std::string title;
    bool        matched;
    int         block_count;
    int         merges_applied;
    int         merges_failed;
};

struct FixResult {
    std::string path;
    int         status;      /* MERGEFIX_* */
    std::string error;
    std::vector<SheetResult>  sheets;
    std::vector<MergeWarning> warnings;
};

/* ── Backend interface ─────────────────────────────────────────── */

FixResult fix_xlsx(const std::string& path, const BlockLayout& layout);

#endif
