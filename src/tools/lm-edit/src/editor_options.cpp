#include "lm/edit/editor_options.hpp"

#include <cstdint>
#include <string>

namespace lm::edit
{

void declareEditorSettings(config::SettingsStore &store)
{
    using config::SettingKind;

    store.declare({"preview", "livePreview", SettingKind::Flag, true,
                   "Hide Markdown markers and style text outside the caret line."});
    store.declare({"preview", "wikiLinks", SettingKind::Flag, true,
                   "Render [[links]] and offer note title completion."});
    store.declare({"preview", "maxCompletions", SettingKind::Count,
                   static_cast<std::int64_t>(wiki::kDefaultCompletionLimit),
                   "Maximum number of note titles offered while typing a link.", 1, 50});
    store.declare({"notes", "directory", SettingKind::Path, std::string(),
                   "Directory holding the notes that wiki links resolve to."});
    store.declare({"search", "caseSensitive", SettingKind::Flag, false,
                   "Initial state of the find bar's case option."});
}

preview::PreviewSettings loadPreviewSettings(const config::SettingsStore &store)
{
    preview::PreviewSettings settings;
    settings.livePreview = store.flag(kSettingLivePreview);
    settings.wikiLinks = store.flag(kSettingWikiLinks);
    const std::int64_t limit = store.count(kSettingMaxCompletions);
    settings.maxCompletions = limit > 0 ? static_cast<std::size_t>(limit) : wiki::kDefaultCompletionLimit;
    return settings;
}

void storePreviewSettings(config::SettingsStore &store, const preview::PreviewSettings &settings)
{
    store.assign(kSettingLivePreview, settings.livePreview);
    store.assign(kSettingWikiLinks, settings.wikiLinks);
    store.assign(kSettingMaxCompletions, static_cast<std::int64_t>(settings.maxCompletions));
}

std::filesystem::path notesDirectory(const config::SettingsStore &store)
{
    std::filesystem::path directory = store.path(kSettingNotesDirectory);
    if (directory.empty())
        return std::filesystem::path(".");
    return directory;
}

bool caseSensitiveSearch(const config::SettingsStore &store)
{
    return store.flag(kSettingCaseSensitiveSearch);
}

} // namespace lm::edit
