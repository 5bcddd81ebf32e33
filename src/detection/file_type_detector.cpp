#include <peek/detection/file_type_detector.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace peek::detection {

namespace {
// Extension to MIME type mapping
const std::unordered_map<std::string, std::string> EXTENSION_MIME_MAP = {
    // Text formats
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},
    {".js", "application/javascript"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".yaml", "application/x-yaml"},
    {".yml", "application/x-yaml"},
    {".toml", "application/toml"},
    {".md", "text/markdown"},
    {".csv", "text/csv"},

    // Documents
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},

    // Images
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},

    // Archives
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".xz", "application/x-xz"},

    // Programming
    {".cpp", "text/x-c++"},
    {".cc", "text/x-c++"},
    {".c", "text/x-c"},
    {".h", "text/x-c"},
    {".hpp", "text/x-c++"},
    {".py", "text/x-python"},
    {".java", "text/x-java"},
    {".rs", "text/x-rust"},
    {".go", "text/x-go"},
    {".sh", "application/x-sh"},

    // Executables
    {".exe", "application/x-msdownload"},
    {".so", "application/x-sharedlib"},
    {".bin", "application/octet-stream"}};
} // namespace

std::string FileTypeDetector::getMimeTypeFromExtension(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext[0] != '.') {
        ext = "." + ext;
    }

    // Convert to lowercase
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = EXTENSION_MIME_MAP.find(ext);
    return it != EXTENSION_MIME_MAP.end() ? it->second : "application/octet-stream";
}

std::string FileTypeDetector::getMimeTypeForPath(const std::filesystem::path& path,
                                                 bool isDirectory) {
    if (isDirectory) {
        return "inode/directory";
    }
    return getMimeTypeFromExtension(path.extension().string());
}

} // namespace peek::detection
