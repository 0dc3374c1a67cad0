#include "streamgate/protocol/ContentHeaders.h"

#include <cctype>
#include <unordered_map>

namespace streamgate {
namespace protocol {

namespace {

const std::unordered_map<std::string, std::string>& MimeTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {"mp4", "video/mp4"},        {"m4v", "video/x-m4v"},       {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},      {"mov", "video/quicktime"},   {"avi", "video/x-msvideo"},
        {"ts", "video/mp2t"},        {"flv", "video/x-flv"},       {"3gp", "video/3gpp"},
        {"mp3", "audio/mpeg"},       {"m4a", "audio/mp4"},         {"aac", "audio/aac"},
        {"ogg", "audio/ogg"},        {"oga", "audio/ogg"},         {"opus", "audio/opus"},
        {"flac", "audio/flac"},      {"wav", "audio/wav"},
        {"jpg", "image/jpeg"},       {"jpeg", "image/jpeg"},       {"png", "image/png"},
        {"gif", "image/gif"},        {"webp", "image/webp"},
        {"pdf", "application/pdf"},  {"zip", "application/zip"},   {"apk", "application/vnd.android.package-archive"},
        {"txt", "text/plain"},       {"srt", "application/x-subrip"}, {"json", "application/json"},
        {"html", "text/html"},       {"htm", "text/html"},
    };
    return table;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string GuessMimeType(const std::string& fileName) {
    const size_t dot = fileName.rfind('.');
    if (dot != std::string::npos && dot + 1 < fileName.size()) {
        std::string ext = fileName.substr(dot + 1);
        for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        auto it = MimeTable().find(ext);
        if (it != MimeTable().end()) return it->second;
    }
    return "application/octet-stream";
}

bool IsInlineMimeType(const std::string& mimeType) {
    return mimeType.rfind("video/", 0) == 0 || mimeType.rfind("audio/", 0) == 0;
}

std::string SanitizeFileName(const std::string& fileName) {
    std::string base = fileName;
    const size_t slash = base.find_last_of("/\\");
    if (slash != std::string::npos) base = base.substr(slash + 1);

    std::string out;
    out.reserve(base.size());
    for (char c : base) {
        if (c == '\r' || c == '\n' || c == '"' || c == ';') continue;
        out.push_back(c);
    }
    return out;
}

std::string PercentEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string PercentDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            const int hi = HexValue(value[i + 1]);
            const int lo = HexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

std::string ContentDispositionValue(const std::string& fileName, const std::string& mimeType) {
    std::string safe = SanitizeFileName(fileName);
    if (safe.empty()) safe = "file";

    // ASCII fallback for clients that ignore filename*.
    std::string ascii;
    for (unsigned char c : safe) {
        ascii.push_back((c >= 0x20 && c < 0x7F && c != '\\') ? static_cast<char>(c) : '_');
    }

    std::string value = IsInlineMimeType(mimeType) ? "inline" : "attachment";
    value += "; filename=\"" + ascii + "\"";
    value += "; filename*=UTF-8''" + PercentEncode(safe);
    return value;
}

} // namespace protocol
} // namespace streamgate
