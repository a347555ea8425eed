#include <gtest/gtest.h>

#include "lm/edit/editor_options.hpp"

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>

using lm::config::SettingsStore;

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("lm_edit_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "lm_edit_options_test.json";
}

} // namespace

TEST(EditorOptions, DeclaresSettingsBySection)
{
    SettingsStore store("lm-edit");
    lm::edit::declareEditorSettings(store);

    EXPECT_TRUE(store.declared("preview.livePreview"));
    EXPECT_TRUE(store.declared("preview.wikiLinks"));
    EXPECT_TRUE(store.declared("preview.maxCompletions"));
    EXPECT_TRUE(store.declared("notes.directory"));
    EXPECT_TRUE(store.declared("search.caseSensitive"));
    EXPECT_EQ(store.specs().size(), 5u);

    const auto settings = lm::edit::loadPreviewSettings(store);
    EXPECT_TRUE(settings.livePreview);
    EXPECT_TRUE(settings.wikiLinks);
    EXPECT_EQ(settings.maxCompletions, 10u);
    EXPECT_FALSE(lm::edit::caseSensitiveSearch(store));
}

TEST(EditorOptions, ClampsCompletionLimit)
{
    SettingsStore store("lm-edit");
    lm::edit::declareEditorSettings(store);

    ASSERT_TRUE(store.assign("preview.maxCompletions", std::int64_t{0}));
    EXPECT_EQ(lm::edit::loadPreviewSettings(store).maxCompletions, 1u);
    ASSERT_TRUE(store.assign("preview.maxCompletions", std::int64_t{400}));
    EXPECT_EQ(lm::edit::loadPreviewSettings(store).maxCompletions, 50u);
}

TEST(EditorOptions, EmptyNotesDirectoryMeansWorkingDirectory)
{
    SettingsStore store("lm-edit");
    lm::edit::declareEditorSettings(store);

    EXPECT_EQ(lm::edit::notesDirectory(store).string(), ".");
    ASSERT_TRUE(store.assign("notes.directory", std::string("/srv/notes")));
    EXPECT_EQ(lm::edit::notesDirectory(store).string(), "/srv/notes");
}

TEST(EditorOptions, StoredSettingsSurviveReload)
{
    SettingsStore store("lm-edit");
    lm::edit::declareEditorSettings(store);

    lm::preview::PreviewSettings settings;
    settings.livePreview = false;
    settings.wikiLinks = true;
    settings.maxCompletions = 25;
    lm::edit::storePreviewSettings(store, settings);
    ASSERT_TRUE(store.assign("search.caseSensitive", true));

    const auto filePath = makeTempFilePath();
    ASSERT_TRUE(store.write(filePath));

    SettingsStore loaded("lm-edit");
    lm::edit::declareEditorSettings(loaded);
    ASSERT_TRUE(loaded.read(filePath));

    const auto restored = lm::edit::loadPreviewSettings(loaded);
    EXPECT_FALSE(restored.livePreview);
    EXPECT_TRUE(restored.wikiLinks);
    EXPECT_EQ(restored.maxCompletions, 25u);
    EXPECT_TRUE(lm::edit::caseSensitiveSearch(loaded));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}
