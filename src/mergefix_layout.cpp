#include "mergefix_types.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <string>

using json = nlohmann::json;

/* ── default layout ──────────────────────────────────────────────── */

/*
 * One report block is 13 content rows plus 2 spacing rows.  The tower id
 * sits in B of the first row; label pairs B:C on rows 0-3, header span
 * B:E on row 6.
 */
BlockLayout default_layout() {
    BlockLayout l;
    l.sheet_pattern = "Performance*";
    l.first_row     = 1;
    l.stride        = 15;
    l.marker_column = 2;
    l.merges = {
        {0, 2, 0, 3},
        {1, 2, 1, 3},
        {2, 2, 2, 3},
        {3, 2, 3, 3},
        {6, 2, 6, 5},
    };
    return l;
}

/* ── JSON ────────────────────────────────────────────────────────── */

/* absent key leaves out untouched */
static bool read_u32(const json& obj, const char* key, uint32_t& out,
                     std::string& err) {
    auto it = obj.find(key);
    if (it == obj.end()) return true;
    if (!it->is_number_integer()) {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    int64_t v = it->get<int64_t>();
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) {
        err = std::string("'") + key + "' out of range";
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static bool read_directive(const json& obj, size_t index, MergeDirective& d,
                           std::string& err) {
    std::string where = "merges[" + std::to_string(index) + "]";
    if (!obj.is_object()) {
        err = where + " must be an object";
        return false;
    }
    for (const char* key : {"row", "col", "last_col"}) {
        if (obj.find(key) == obj.end()) {
            err = where + " missing '" + key + "'";
            return false;
        }
    }
    d = MergeDirective{0, 0, 0, 0};
    if (!read_u32(obj, "row", d.row, err) ||
        !read_u32(obj, "col", d.col, err) ||
        !read_u32(obj, "last_col", d.last_col, err)) {
        err = where + ": " + err;
        return false;
    }
    d.last_row = d.row;
    if (!read_u32(obj, "last_row", d.last_row, err)) {
        err = where + ": " + err;
        return false;
    }

    if (d.col == 0) {
        err = where + ": columns are 1-based";
        return false;
    }
    if (d.last_row >= kSheetMaxRow || d.last_col > kSheetMaxColumn) {
        err = where + ": range exceeds sheet limits";
        return false;
    }
    if (d.last_row < d.row || d.last_col < d.col) {
        err = where + ": last_row/last_col before row/col";
        return false;
    }
    if (d.last_row == d.row && d.last_col == d.col) {
        err = where + ": range must span more than one cell";
        return false;
    }
    return true;
}

bool layout_from_json(const std::string& text, BlockLayout& out, std::string& err) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        err = "layout is not valid JSON";
        return false;
    }
    if (!doc.is_object()) {
        err = "layout must be a JSON object";
        return false;
    }

    BlockLayout l = default_layout();

    auto pat = doc.find("sheet_pattern");
    if (pat != doc.end()) {
        if (!pat->is_string()) {
            err = "'sheet_pattern' must be a string";
            return false;
        }
        l.sheet_pattern = pat->get<std::string>();
    }

    if (!read_u32(doc, "first_row", l.first_row, err) ||
        !read_u32(doc, "stride", l.stride, err) ||
        !read_u32(doc, "marker_column", l.marker_column, err))
        return false;

    if (l.first_row == 0 || l.marker_column == 0) {
        err = "rows and columns are 1-based";
        return false;
    }
    if (l.first_row > kSheetMaxRow || l.marker_column > kSheetMaxColumn) {
        err = "'first_row'/'marker_column' exceed sheet limits";
        return false;
    }
    if (l.stride == 0) {
        err = "'stride' must be positive";
        return false;
    }

    auto merges = doc.find("merges");
    if (merges != doc.end()) {
        if (!merges->is_array()) {
            err = "'merges' must be an array";
            return false;
        }
        l.merges.clear();
        for (size_t i = 0; i < merges->size(); i++) {
            MergeDirective d;
            if (!read_directive((*merges)[i], i, d, err)) return false;
            l.merges.push_back(d);
        }
    }

    out = std::move(l);
    return true;
}

std::string layout_to_json(const BlockLayout& layout) {
    json obj;
    obj["sheet_pattern"] = layout.sheet_pattern;
    obj["first_row"]     = layout.first_row;
    obj["stride"]        = layout.stride;
    obj["marker_column"] = layout.marker_column;
    json merges = json::array();
    for (const auto& d : layout.merges) {
        json m;
        m["row"]      = d.row;
        m["col"]      = d.col;
        m["last_row"] = d.last_row;
        m["last_col"] = d.last_col;
        merges.push_back(m);
    }
    obj["merges"] = merges;
    return obj.dump();
}

/* ── sheet selection ─────────────────────────────────────────────── */

static bool same_char(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

bool sheet_matches(const std::string& pattern, const std::string& title) {
    size_t p = 0, t = 0;
    size_t star = std::string::npos, resume = 0;

    while (t < title.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || same_char(pattern[p], title[t]))) {
            p++;
            t++;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string::npos) {
            /* let the last '*' swallow one more character */
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') p++;
    return p == pattern.size();
}
