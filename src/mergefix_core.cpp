#include "mergefix.h"
#include "mergefix_types.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <system_error>

using json = nlohmann::json;

/* ── result handle ──────────────────────────────────────────────────── */

struct mergefix_result {
    FixResult result;

    /* report (single row) */
    mergefix_report report_view;
    std::string     report_json;

    /* sheet iterator */
    size_t          sheet_index;
    mergefix_sheet  sheet_view;
    std::string     sheet_json;

    /* warning iterator */
    size_t           warning_index;
    mergefix_warning warning_view;
    std::string      warning_json;
};

static mergefix_result* wrap_result(FixResult r) {
    auto* c = new mergefix_result{};
    c->result        = std::move(r);
    c->sheet_index   = 0;
    c->warning_index = 0;
    return c;
}

/* ── fix ────────────────────────────────────────────────────────────── */

mergefix_result* mergefix_fix(const char* path, const char* layout_json) {
    if (!path) return nullptr;

    BlockLayout layout = default_layout();
    if (layout_json) {
        std::string err;
        if (!layout_from_json(layout_json, layout, err)) {
            FixResult r;
            std::error_code ec;
            auto abs = std::filesystem::absolute(path, ec);
            r.path   = ec ? std::string(path) : abs.string();
            r.status = MERGEFIX_ELAYOUT;
            r.error  = "invalid layout: " + err;
            return wrap_result(std::move(r));
        }
    }
    return wrap_result(fix_xlsx(path, layout));
}

int mergefix_fix_file(const char* path) {
    mergefix_result* c = mergefix_fix(path, nullptr);
    if (!c) return 1;
    int status = c->result.status;
    mergefix_close(c);
    return status == MERGEFIX_OK ? 0 : 1;
}

const char* mergefix_default_layout_json(void) {
    static const std::string text = layout_to_json(default_layout());
    return text.c_str();
}

/* ── report ─────────────────────────────────────────────────────────── */

struct Totals {
    int matched = 0;
    int blocks  = 0;
    int applied = 0;
    int failed  = 0;
};

static Totals totals(const FixResult& r) {
    Totals t;
    for (const auto& s : r.sheets) {
        if (s.matched) t.matched++;
        t.blocks  += s.block_count;
        t.applied += s.merges_applied;
        t.failed  += s.merges_failed;
    }
    return t;
}

const mergefix_report* mergefix_get_report(mergefix_result* c) {
    if (!c) return nullptr;
    Totals t = totals(c->result);
    c->report_view.path           = c->result.path.c_str();
    c->report_view.status         = c->result.status;
    c->report_view.error          = c->result.error.empty() ? nullptr : c->result.error.c_str();
    c->report_view.sheet_count    = static_cast<int>(c->result.sheets.size());
    c->report_view.sheets_matched = t.matched;
    c->report_view.block_count    = t.blocks;
    c->report_view.merges_applied = t.applied;
    c->report_view.merges_failed  = t.failed;
    return &c->report_view;
}

const char* mergefix_get_report_json(mergefix_result* c) {
    if (!c) return nullptr;
    Totals t = totals(c->result);
    json obj;
    obj["path"]           = c->result.path;
    obj["status"]         = c->result.status;
    obj["error"]          = c->result.error.empty() ? json(nullptr) : json(c->result.error);
    obj["sheet_count"]    = c->result.sheets.size();
    obj["sheets_matched"] = t.matched;
    obj["block_count"]    = t.blocks;
    obj["merges_applied"] = t.applied;
    obj["merges_failed"]  = t.failed;
    c->report_json = obj.dump();
    return c->report_json.c_str();
}

/* ── sheet iterator ─────────────────────────────────────────────────── */

const mergefix_sheet* mergefix_next_sheet(mergefix_result* c) {
    if (!c || c->sheet_index >= c->result.sheets.size()) return nullptr;
    const SheetResult& s = c->result.sheets[c->sheet_index++];
    c->sheet_view.sheet_index    = s.sheet_index;
    c->sheet_view.title          = s.title.c_str();
    c->sheet_view.matched        = s.matched ? 1 : 0;
    c->sheet_view.block_count    = s.block_count;
    c->sheet_view.merges_applied = s.merges_applied;
    c->sheet_view.merges_failed  = s.merges_failed;
    return &c->sheet_view;
}

const char* mergefix_next_sheet_json(mergefix_result* c) {
    if (!c || c->sheet_index >= c->result.sheets.size()) return nullptr;
    const SheetResult& s = c->result.sheets[c->sheet_index++];
    json obj;
    obj["sheet_index"]    = s.sheet_index;
    obj["title"]          = s.title;
    obj["matched"]        = s.matched ? 1 : 0;
    obj["block_count"]    = s.block_count;
    obj["merges_applied"] = s.merges_applied;
    obj["merges_failed"]  = s.merges_failed;
    c->sheet_json = obj.dump();
    return c->sheet_json.c_str();
}

/* ── warning iterator ───────────────────────────────────────────────── */

const mergefix_warning* mergefix_next_warning(mergefix_result* c) {
    if (!c || c->warning_index >= c->result.warnings.size()) return nullptr;
    const MergeWarning& w = c->result.warnings[c->warning_index++];
    c->warning_view.sheet_index = w.sheet_index;
    c->warning_view.sheet       = w.sheet.c_str();
    c->warning_view.row         = w.row;
    c->warning_view.range       = w.range.c_str();
    c->warning_view.message     = w.message.c_str();
    return &c->warning_view;
}

const char* mergefix_next_warning_json(mergefix_result* c) {
    if (!c || c->warning_index >= c->result.warnings.size()) return nullptr;
    const MergeWarning& w = c->result.warnings[c->warning_index++];
    json obj;
    obj["sheet_index"] = w.sheet_index;
    obj["sheet"]       = w.sheet;
    obj["row"]         = w.row;
    obj["range"]       = w.range;
    obj["message"]     = w.message;
    c->warning_json = obj.dump();
    return c->warning_json.c_str();
}

/* ── close ──────────────────────────────────────────────────────────── */

void mergefix_close(mergefix_result* c) {
    delete c;
}
