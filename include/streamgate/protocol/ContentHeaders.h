#pragma once

#include <string>

namespace streamgate {
namespace protocol {

// MIME type from the file extension, or application/octet-stream.
std::string GuessMimeType(const std::string& fileName);

// video/* and audio/* render inline; everything else downloads.
bool IsInlineMimeType(const std::string& mimeType);

// Removes CR, LF, '"' and ';' and any path components.
std::string SanitizeFileName(const std::string& fileName);

// RFC 3986 percent-encoding of every byte outside the unreserved set.
std::string PercentEncode(const std::string& value);
// Decodes %XX escapes; malformed escapes are kept literally.
std::string PercentDecode(const std::string& value);

// e.g. inline; filename="clip.mp4"; filename*=UTF-8''clip.mp4
std::string ContentDispositionValue(const std::string& fileName, const std::string& mimeType);

} // namespace protocol
} // namespace streamgate
