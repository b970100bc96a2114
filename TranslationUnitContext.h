#ifndef TRANSLATION_UNIT_CONTEXT_H
#define TRANSLATION_UNIT_CONTEXT_H

enum class Severity;

struct TranslationUnitContext {
    static thread_local TranslationUnitContext* it;

    explicit TranslationUnitContext(ostream& message_stream);
    ~TranslationUnitContext();
    void operator=(const TranslationUnitContext&) = delete;

    // Owns source labels so that Locations may refer to them by string_view.
    string_view intern_filename(string_view filename);

    ostream& message_stream;
    Severity highest_severity{};

    unordered_set<string> filenames;
};

#endif
