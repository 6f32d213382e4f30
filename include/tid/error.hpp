#pragma once

#include <string>

namespace tid {

struct TidError {
    enum Code {
        InvalidPrefix,
        InvalidSuffixLength,
        InvalidSuffixRange,
        InvalidSuffixAlphabet,
        EmptyPrefixWithSeparator,
        PrefixMismatch,
        InvalidFormat,
        Parse,
        IO,
        Config
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    TidError() = default;
    TidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace tid
