#pragma once

#include "lm/preview/preview_controller.hpp"
#include "lm/settings.hpp"

#include <filesystem>
#include <string_view>

namespace lm::edit
{

inline constexpr std::string_view kSettingLivePreview = "preview.livePreview";
inline constexpr std::string_view kSettingWikiLinks = "preview.wikiLinks";
inline constexpr std::string_view kSettingMaxCompletions = "preview.maxCompletions";
inline constexpr std::string_view kSettingNotesDirectory = "notes.directory";
inline constexpr std::string_view kSettingCaseSensitiveSearch = "search.caseSensitive";

void declareEditorSettings(config::SettingsStore &store);

preview::PreviewSettings loadPreviewSettings(const config::SettingsStore &store);
void storePreviewSettings(config::SettingsStore &store, const preview::PreviewSettings &settings);

// The notes root. An empty setting means the working directory.
std::filesystem::path notesDirectory(const config::SettingsStore &store);
bool caseSensitiveSearch(const config::SettingsStore &store);

} // namespace lm::edit
