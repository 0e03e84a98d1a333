#include "mergefix.h"
#include "mergefix_types.h"

#include <xlnt/xlnt.hpp>

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

static const uint64_t kMaxRow    = kSheetMaxRow;
static const uint32_t kMaxColumn = kSheetMaxColumn;

/* ── helpers ─────────────────────────────────────────────────────── */

static bool is_blank(const std::string& s) {
    for (char c : s)
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    return true;
}

/* "A", "B", ... "Z", "AA"; works past the sheet limit for messages */
static std::string column_letters(uint32_t col) {
    std::string out;
    while (col > 0) {
        uint32_t rem = (col - 1) % 26;
        out.insert(out.begin(), static_cast<char>('A' + rem));
        col = (col - 1) / 26;
    }
    return out;
}

static std::string range_label(uint32_t col, uint64_t row,
                               uint32_t last_col, uint64_t last_row) {
    return column_letters(col) + std::to_string(row) + ":" +
           column_letters(last_col) + std::to_string(last_row);
}

/* rendered text of a cell, empty if the cell was never written */
static std::string cell_text(const xlnt::worksheet& ws, uint64_t row, uint32_t col) {
    if (row > kMaxRow || col > kMaxColumn) return "";
    xlnt::cell_reference ref(xlnt::column_t(col), static_cast<xlnt::row_t>(row));
    if (!ws.has_cell(ref)) return "";
    return ws.cell(ref).to_string();
}

static bool overlaps(const xlnt::range_reference& a, const xlnt::range_reference& b) {
    auto a_tl = a.top_left(), a_br = a.bottom_right();
    auto b_tl = b.top_left(), b_br = b.bottom_right();
    return a_tl.row() <= b_br.row() && b_tl.row() <= a_br.row() &&
           a_tl.column() <= b_br.column() && b_tl.column() <= a_br.column();
}

/*
 * Any merged range touching the target is dropped as a whole, the way the
 * spreadsheet application unmerges a partially selected merge area.  An
 * already merged identical range is dropped and merged again, so repeated
 * runs leave the same state.
 */
static void remerge(xlnt::worksheet& ws, const xlnt::range_reference& target) {
    for (const auto& mr : ws.merged_ranges()) {
        if (overlaps(mr, target))
            ws.unmerge_cells(mr);
    }
    ws.merge_cells(target);
}

/* ── block repair ────────────────────────────────────────────────── */

static void fix_block(xlnt::worksheet& ws, uint64_t first_row,
                      const BlockLayout& layout, SheetResult& sheet,
                      std::vector<MergeWarning>& warnings) {
    for (const auto& d : layout.merges) {
        uint64_t top    = first_row + d.row;
        uint64_t bottom = first_row + d.last_row;

        MergeWarning w;
        w.sheet_index = sheet.sheet_index;
        w.sheet       = sheet.title;
        w.row         = static_cast<uint32_t>(top);
        w.range       = range_label(d.col, top, d.last_col, bottom);

        if (bottom > kMaxRow || d.last_col > kMaxColumn) {
            w.message = "range exceeds sheet limits";
            warnings.push_back(std::move(w));
            sheet.merges_failed++;
            continue;
        }

        xlnt::range_reference target(
            xlnt::cell_reference(xlnt::column_t(d.col), static_cast<xlnt::row_t>(top)),
            xlnt::cell_reference(xlnt::column_t(d.last_col), static_cast<xlnt::row_t>(bottom)));

        try {
            remerge(ws, target);
            sheet.merges_applied++;
        } catch (const xlnt::exception& e) {
            w.message = e.what();
            warnings.push_back(std::move(w));
            sheet.merges_failed++;
        }
    }
}

static void fix_sheet(xlnt::worksheet& ws, const BlockLayout& layout,
                      SheetResult& sheet, std::vector<MergeWarning>& warnings) {
    for (uint64_t row = layout.first_row; row <= kMaxRow; row += layout.stride) {
        if (is_blank(cell_text(ws, row, layout.marker_column))) break;
        sheet.block_count++;
        fix_block(ws, row, layout, sheet, warnings);
    }
}

/* ── fix ─────────────────────────────────────────────────────────── */

FixResult fix_xlsx(const std::string& path, const BlockLayout& layout) {
    FixResult result;
    result.status = MERGEFIX_OK;

    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    result.path = ec ? path : abs.string();

    if (!std::filesystem::is_regular_file(result.path, ec)) {
        result.status = MERGEFIX_ENOENT;
        result.error  = "file not found: " + result.path;
        return result;
    }

    /* released on every return below */
    xlnt::workbook wb;

    try {
        wb.load(result.path);
    } catch (const std::exception& e) {
        result.status = MERGEFIX_EOPEN;
        result.error  = std::string("cannot open workbook: ") + e.what();
        return result;
    }

    try {
        for (std::size_t si = 0; si < wb.sheet_count(); si++) {
            auto ws = wb.sheet_by_index(si);

            SheetResult sheet;
            sheet.sheet_index    = static_cast<uint32_t>(si);
            sheet.title          = ws.title();
            sheet.matched        = sheet_matches(layout.sheet_pattern, sheet.title);
            sheet.block_count    = 0;
            sheet.merges_applied = 0;
            sheet.merges_failed  = 0;

            if (sheet.matched)
                fix_sheet(ws, layout, sheet, result.warnings);

            result.sheets.push_back(std::move(sheet));
        }
    } catch (const std::exception& e) {
        result.status = MERGEFIX_EPROCESS;
        result.error  = std::string("processing failed: ") + e.what();
        return result;
    }

    try {
        wb.save(result.path);
    } catch (const std::exception& e) {
        result.status = MERGEFIX_ESAVE;
        result.error  = std::string("cannot save workbook: ") + e.what();
        return result;
    }

    return result;
}
