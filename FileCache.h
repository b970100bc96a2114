#ifndef FILE_CACHE_H
#define FILE_CACHE_H

struct SourceFile {
    bool exists{};
    filesystem::path path;

    // Logical source text: lines are spliced and the text always ends with a new-line.
    string text;
};

// Source files named more than once on the command line are read once.
struct FileCache {
    const SourceFile& read(const filesystem::path& path);

    unordered_map<string, SourceFile> files;
};

#endif
