#ifndef LEX_LOCATION_H
#define LEX_LOCATION_H

struct Location {
    size_t line{};
    size_t column{};

    // Refers to a filename owned by TranslationUnitContext.
    string_view filename;
};

#endif
