#include "mergefix.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

static std::vector<char> read_file(const char* path) {
    FILE* f = fopen(path, "rb");
    if (!f) return {};
    fseek(f, 0, SEEK_END);
    long sz = ftell(f);
    rewind(f);
    if (sz <= 0) { fclose(f); return {}; }
    std::vector<char> buf(sz);
    if (fread(buf.data(), 1, sz, f) != static_cast<size_t>(sz))
        buf.clear();
    fclose(f);
    return buf;
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        fprintf(stderr, "usage: %s <report.xlsx>\n", argv[0]);
        return 1;
    }
    const char* path = argv[1];

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        fprintf(stderr, "ERROR: file not found: %s\n", path);
        return 1;
    }

    /* optional layout override for other report templates */
    std::string layout;
    const char* layout_path = std::getenv("MERGEFIX_LAYOUT");
    if (layout_path && *layout_path) {
        auto buf = read_file(layout_path);
        if (buf.empty()) {
            fprintf(stderr, "ERROR: cannot read layout %s\n", layout_path);
            return 1;
        }
        layout.assign(buf.begin(), buf.end());
    }

    std::unique_ptr<mergefix_result, decltype(&mergefix_close)> res(
        mergefix_fix(path, layout.empty() ? nullptr : layout.c_str()),
        &mergefix_close);

    while (auto* w = mergefix_next_warning(res.get()))
        fprintf(stderr, "warning: %s row %u: cannot merge %s: %s\n",
                w->sheet, w->row, w->range, w->message);

    auto* report = mergefix_get_report(res.get());
    if (report->status != MERGEFIX_OK) {
        fprintf(stderr, "ERROR: %s\n", report->error);
        return 1;
    }

    while (auto* s = mergefix_next_sheet(res.get())) {
        if (!s->matched) continue;
        printf("  %s: %d blocks, %d merges, %d failed\n",
               s->title, s->block_count, s->merges_applied, s->merges_failed);
    }
    printf("SUCCESS\n");
    return 0;
}
