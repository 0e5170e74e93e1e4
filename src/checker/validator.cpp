// BADPATH - Invalid-Character Validator Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/validator.h"

#include "badpath/checker/normalizer.h"
#include "badpath/util/logging.h"

#include <algorithm>
#include <cctype>

namespace badpath {
namespace checker {

namespace {

/// "X:" at the very start, and no other colon anywhere
bool IsDriveColon(const std::string& text, size_t pos) {
    return pos == 1 &&
           std::isalpha(static_cast<unsigned char>(text[0])) &&
           std::count(text.begin(), text.end(), ':') == 1;
}

} // namespace

bool IsReservedName(const std::string& component, Platform platform) {
    const auto& reserved = ReservedNames(platform);
    if (reserved.empty()) {
        return false;
    }

    std::string stem = component.substr(0, component.find('.'));
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    return std::find(reserved.begin(), reserved.end(), stem) != reserved.end();
}

bool HasInvalidChars(const std::string& text, Platform platform) {
    const auto& invalid = InvalidCharacters(platform);

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (std::find(invalid.begin(), invalid.end(), c) == invalid.end()) {
            continue;
        }
        if (platform == Platform::Windows && c == ':' && IsDriveColon(text, i)) {
            continue;
        }
        LOG_DEBUG(util::LogCategory::VALIDATE)
            << "Invalid character (code " << static_cast<int>(static_cast<unsigned char>(c))
            << ") at offset " << i;
        return true;
    }

    if (platform != Platform::Windows) {
        return false;
    }

    PathComponents components = SplitComponents(text, platform);
    for (const auto& part : components.parts) {
        if (IsReservedName(part, platform)) {
            LOG_DEBUG(util::LogCategory::VALIDATE) << "Reserved name " << part;
            return true;
        }
    }

    if (!components.parts.empty()) {
        const std::string& last = components.parts.back();
        if (last != "." && last != ".." && HasInvalidTrailingChar(platform, last)) {
            LOG_DEBUG(util::LogCategory::VALIDATE) << "Invalid trailing character in '" << last << "'";
            return true;
        }
    }

    return false;
}

} // namespace checker
} // namespace badpath
