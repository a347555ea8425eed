#pragma once

#include "lm/wiki/autocomplete.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lm::edit
{

inline constexpr std::size_t kMaxFileNameChars = 200;
inline constexpr int kMaxNameSuffix = 999;

struct NoteFile
{
    std::filesystem::path path;
    std::string title;
    std::chrono::system_clock::time_point updatedAt{};
};

// A flat directory of *.md notes, addressed by title.
class NoteDirectory
{
public:
    explicit NoteDirectory(std::filesystem::path directory);

    const std::filesystem::path &root() const noexcept { return rootPath; }

    // Most recently modified first. Unreadable entries are skipped.
    std::vector<NoteFile> scan() const;
    wiki::NoteTitleIndex titleIndex() const;

    std::optional<std::filesystem::path> findByTitle(std::string_view title) const;
    std::optional<std::filesystem::path> findOrCreate(std::string_view title) const;

    static std::string titleFromContent(std::string_view content);
    static std::string sanitizeFileName(std::string_view title);

private:
    // "<name>.md", then "<name>_2.md" .. "<name>_999.md", then a UTC
    // timestamp suffix. Empty when every candidate is taken.
    std::optional<std::filesystem::path> uniquePathFor(const std::string &baseName) const;

    std::filesystem::path rootPath;
};

} // namespace lm::edit
