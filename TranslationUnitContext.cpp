#include "TranslationUnitContext.h"

#include "Message.h"

thread_local TranslationUnitContext* TranslationUnitContext::it;

TranslationUnitContext::TranslationUnitContext(ostream& message_stream): message_stream(message_stream) {
    assert(!it);
    it = this;
}

TranslationUnitContext::~TranslationUnitContext() {
    assert(it == this);
    it = nullptr;
}

string_view TranslationUnitContext::intern_filename(string_view filename) {
    auto& str = *filenames.emplace(filename).first;
    return string_view(str.data(), str.length());
}
