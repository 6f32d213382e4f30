#include <tid/error.hpp>

namespace tid {

const char* TidError::code_name(Code c) {
    switch (c) {
        case InvalidPrefix:            return "InvalidPrefix";
        case InvalidSuffixLength:      return "InvalidSuffixLength";
        case InvalidSuffixRange:       return "InvalidSuffixRange";
        case InvalidSuffixAlphabet:    return "InvalidSuffixAlphabet";
        case EmptyPrefixWithSeparator: return "EmptyPrefixWithSeparator";
        case PrefixMismatch:           return "PrefixMismatch";
        case InvalidFormat:            return "InvalidFormat";
        case Parse:                    return "Parse";
        case IO:                       return "IO";
        case Config:                   return "Config";
    }
    return "Unknown";
}

std::string TidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace tid
