// BADPATH - Invalid-Character Validator
// Copyright (c) 2024 BADPATH Developers
// MIT License

#ifndef BADPATH_CHECKER_VALIDATOR_H
#define BADPATH_CHECKER_VALIDATOR_H

#include "badpath/platform/platform.h"

#include <string>

namespace badpath {
namespace checker {

/**
 * Check the raw path text for characters and names the platform forbids.
 *
 * - Any character from InvalidCharacters(platform) fails, except the colon
 *   of a leading Windows drive designator when it is the only colon.
 * - On Windows, a component whose stem (text before the first '.') is a
 *   reserved device name fails, as does a final component ending in a space
 *   or a period ("." and ".." excepted).
 *
 * Pure text inspection; the filesystem is never consulted.
 */
bool HasInvalidChars(const std::string& text, Platform platform = HostPlatform());

/// True if the component's stem is a reserved device name (CON, LPT1, ...)
bool IsReservedName(const std::string& component, Platform platform);

} // namespace checker
} // namespace badpath

#endif // BADPATH_CHECKER_VALIDATOR_H
