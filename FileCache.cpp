#include "FileCache.h"

// Translation phases 1 and 2: reflex::Input normalizes the encoding to UTF-8 and backslash-newline pairs are
// deleted. The deleted new-lines are restored at the end of the logical line so that token line numbers
// still match the physical lines of the file.
static string splice_lines(const Input& input) {
    Input in(input);

    string raw;
    char buffer[0x10000];
    for (;;) {
        auto bytes_read = in.get(buffer, sizeof(buffer));
        if (bytes_read == 0) break;
        raw.append(buffer, bytes_read);
    }

    string text;
    text.reserve(raw.size() + 1);

    size_t deleted_newlines = 0;
    for (size_t i = 0; i < raw.size(); ++i) {
        auto c = raw[i];
        if (c == '\\' && i + 1 < raw.size() && raw[i + 1] == '\n') {
            ++deleted_newlines;
            ++i;
            continue;
        }

        text += c;
        if (c == '\n' && deleted_newlines) {
            text.append(deleted_newlines, '\n');
            deleted_newlines = 0;
        }
    }

    if (text.empty() || text.back() != '\n') text += '\n';
    text.append(deleted_newlines, '\n');

    return text;
}

const SourceFile& FileCache::read(const filesystem::path& path) {
    auto it = files.find(path.string());
    if (it != files.end()) return it->second;

    auto& result = files[path.string()];
    result.path = path;

    filesystem::path preferred(path);
    preferred.make_preferred();

#ifdef _WIN32
    auto file = _wfopen(preferred.c_str(), L"rb");
#else
    auto file = fopen(preferred.c_str(), "rb");
#endif
    if (file) {
        result.exists = true;
        result.text = splice_lines(Input(file));
        fclose(file);
    }

    return result;
}
