#include "lm/edit/note_directory.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>

namespace lm::edit
{
namespace
{
namespace fs = std::filesystem;

std::string trim(std::string_view view)
{
    std::size_t start = 0;
    while (start < view.size() && std::isspace(static_cast<unsigned char>(view[start])))
        ++start;
    std::size_t end = view.size();
    while (end > start && std::isspace(static_cast<unsigned char>(view[end - 1])))
        --end;
    return std::string(view.substr(start, end - start));
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool isContinuationByte(char ch) noexcept
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::size_t countCodePoints(std::string_view text) noexcept
{
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
        return !isContinuationByte(ch);
    }));
}

// Byte length of the first count code points.
std::size_t prefixBytes(std::string_view text, std::size_t count) noexcept
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (isContinuationByte(text[i]))
            continue;
        if (seen == count)
            return i;
        ++seen;
    }
    return text.size();
}

bool isMarkdownFile(const fs::path &path)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension == ".md";
}

std::optional<std::string> readFile(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::chrono::system_clock::time_point modificationTime(const fs::path &path)
{
    std::error_code ec;
    auto written = fs::last_write_time(path, ec);
    if (ec)
        return {};
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(written));
}

// UTC, YYYYMMDDHHMMSS.
std::string timestampSuffix()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buffer[16] = {};
    if (std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &utc) == 0)
        return std::to_string(static_cast<long long>(now));
    return buffer;
}

} // namespace

NoteDirectory::NoteDirectory(std::filesystem::path directory)
    : rootPath(std::move(directory))
{
    if (rootPath.empty())
        rootPath = ".";
}

std::vector<NoteFile> NoteDirectory::scan() const
{
    std::vector<NoteFile> notes;
    std::error_code ec;
    fs::directory_iterator it(rootPath, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return notes;

    fs::directory_iterator endIter;
    for (; it != endIter; it.increment(ec))
    {
        if (ec)
            break;
        const fs::directory_entry &entry = *it;
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || entryEc || !isMarkdownFile(entry.path()))
            continue;
        auto content = readFile(entry.path());
        if (!content)
            continue;

        NoteFile note;
        note.path = entry.path();
        note.title = titleFromContent(*content);
        if (note.title.empty())
            note.title = entry.path().stem().string();
        note.updatedAt = modificationTime(entry.path());
        notes.push_back(std::move(note));
    }

    std::sort(notes.begin(), notes.end(), [](const NoteFile &a, const NoteFile &b) {
        if (a.updatedAt != b.updatedAt)
            return a.updatedAt > b.updatedAt;
        return a.path < b.path;
    });
    return notes;
}

wiki::NoteTitleIndex NoteDirectory::titleIndex() const
{
    std::vector<wiki::NoteTitleEntry> entries;
    for (auto &note : scan())
        entries.push_back({note.path.filename().string(), std::move(note.title), note.updatedAt});
    return wiki::NoteTitleIndex(std::move(entries));
}

std::optional<std::filesystem::path> NoteDirectory::findByTitle(std::string_view title) const
{
    const std::string wanted = trim(title);
    if (wanted.empty())
        return std::nullopt;
    for (const auto &note : scan())
    {
        if (equalsIgnoreCase(note.title, wanted))
            return note.path;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> NoteDirectory::findOrCreate(std::string_view title) const
{
    const std::string wanted = trim(title);
    if (wanted.empty())
        return std::nullopt;
    if (auto existing = findByTitle(wanted))
        return existing;

    std::error_code ec;
    fs::create_directories(rootPath, ec);
    if (ec)
        return std::nullopt;

    const auto path = uniquePathFor(sanitizeFileName(wanted));
    if (!path)
        return std::nullopt;
    // Never truncate an existing note.
    if (fs::exists(*path, ec) || ec)
        return std::nullopt;
    std::ofstream out(*path, std::ios::binary);
    if (!out)
        return std::nullopt;
    out << "# " << wanted << "\n\n";
    out.close();
    if (!out)
        return std::nullopt;
    return *path;
}

std::string NoteDirectory::titleFromContent(std::string_view content)
{
    std::size_t lineStart = 0;
    while (lineStart < content.size())
    {
        std::size_t lineEnd = content.find('\n', lineStart);
        if (lineEnd == std::string_view::npos)
            lineEnd = content.size();
        const std::string line = trim(content.substr(lineStart, lineEnd - lineStart));
        if (line.rfind("# ", 0) == 0)
            return trim(std::string_view(line).substr(2));
        if (line.rfind("## ", 0) == 0)
            return trim(std::string_view(line).substr(3));
        lineStart = lineEnd + 1;
    }
    return {};
}

std::string NoteDirectory::sanitizeFileName(std::string_view title)
{
    std::string name = trim(title);
    for (char &ch : name)
    {
        switch (ch)
        {
        case '/':
        case '\\':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|':
            ch = '_';
            break;
        default:
            break;
        }
    }
    if (countCodePoints(name) > kMaxFileNameChars)
        name = name.substr(0, prefixBytes(name, kMaxFileNameChars - 3)) + "...";
    if (name.empty())
        name = "Untitled";
    return name;
}

std::optional<std::filesystem::path> NoteDirectory::uniquePathFor(const std::string &baseName) const
{
    std::error_code ec;
    fs::path candidate = rootPath / (baseName + ".md");
    if (!fs::exists(candidate, ec) && !ec)
        return candidate;
    for (int suffix = 2; suffix <= kMaxNameSuffix; ++suffix)
    {
        candidate = rootPath / (baseName + "_" + std::to_string(suffix) + ".md");
        if (!fs::exists(candidate, ec) && !ec)
            return candidate;
    }

    candidate = rootPath / (baseName + "_" + timestampSuffix() + ".md");
    if (!fs::exists(candidate, ec) && !ec)
        return candidate;
    return std::nullopt;
}

} // namespace lm::edit
