#include <gtest/gtest.h>

#include "lm/settings.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include <nlohmann/json.hpp>

using lm::config::SettingKind;
using lm::config::SettingsStore;
using lm::config::SettingSpec;
using lm::config::SettingValue;

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
        auto candidate = base / ("lm_settings_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "lm_settings_test.json";
}

void declareSample(SettingsStore &store)
{
    store.declare({"notes", "title", SettingKind::Text, std::string("none"), "Title of the index note"});
    store.declare({"preview", "limit", SettingKind::Count, std::int64_t{5}, "Bounded count", 1, 20});
    store.declare({"preview", "enabled", SettingKind::Flag, true, "Toggle"});
}

} // namespace

TEST(SettingsStore, ReadsInitialValuesUntilAssigned)
{
    SettingsStore store("test-app");
    declareSample(store);

    EXPECT_TRUE(store.declared("preview.enabled"));
    EXPECT_FALSE(store.declared("enabled"));
    EXPECT_FALSE(store.declared("search.enabled"));
    EXPECT_TRUE(store.flag("preview.enabled"));

    ASSERT_TRUE(store.assign("preview.enabled", false));
    EXPECT_FALSE(store.flag("preview.enabled"));

    store.revert("preview.enabled");
    EXPECT_TRUE(store.flag("preview.enabled"));
}

TEST(SettingsStore, CoercesTextToDeclaredKind)
{
    SettingsStore store("test-app");
    declareSample(store);

    EXPECT_TRUE(store.assign("preview.limit", std::string("12")));
    EXPECT_TRUE(store.assign("preview.enabled", std::string("Off")));
    EXPECT_EQ(store.count("preview.limit"), 12);
    EXPECT_FALSE(store.flag("preview.enabled"));
}

TEST(SettingsStore, RejectsValuesWithoutAReading)
{
    SettingsStore store("test-app");
    declareSample(store);
    ASSERT_TRUE(store.assign("preview.limit", std::int64_t{7}));

    EXPECT_FALSE(store.assign("preview.limit", std::string("many")));
    EXPECT_FALSE(store.assign("preview.enabled", std::string("maybe")));
    EXPECT_FALSE(store.assign("preview.missing", true));
    EXPECT_EQ(store.count("preview.limit"), 7);
    EXPECT_TRUE(store.flag("preview.enabled"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(store.value("preview.missing")));
}

TEST(SettingsStore, ClampsCountsIntoRange)
{
    SettingsStore store("test-app");
    declareSample(store);

    ASSERT_TRUE(store.assign("preview.limit", std::int64_t{0}));
    EXPECT_EQ(store.count("preview.limit"), 1);
    ASSERT_TRUE(store.assign("preview.limit", std::int64_t{99}));
    EXPECT_EQ(store.count("preview.limit"), 20);
}

TEST(SettingsStore, RedeclaringKeepsCompatibleAssignments)
{
    SettingsStore store("test-app");
    declareSample(store);
    ASSERT_TRUE(store.assign("preview.limit", std::int64_t{18}));

    store.declare({"preview", "limit", SettingKind::Count, std::int64_t{5}, "Tighter", 1, 10});
    EXPECT_EQ(store.count("preview.limit"), 10);
    EXPECT_EQ(store.specs().size(), 3u);
}

TEST(SettingsStore, WritesSettingsNestedBySection)
{
    SettingsStore store("test-app");
    declareSample(store);
    ASSERT_TRUE(store.assign("notes.title", std::string("Inbox")));
    ASSERT_TRUE(store.assign("preview.limit", std::int64_t{12}));

    const auto filePath = makeTempFilePath();
    ASSERT_TRUE(store.write(filePath));

    std::ifstream in(filePath);
    const nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    ASSERT_TRUE(data.is_object());
    EXPECT_EQ(data["notes"]["title"], "Inbox");
    EXPECT_EQ(data["preview"]["limit"], 12);
    EXPECT_EQ(data["preview"]["enabled"], true);

    SettingsStore loaded("test-app");
    declareSample(loaded);
    ASSERT_TRUE(loaded.read(filePath));
    EXPECT_EQ(loaded.text("notes.title"), "Inbox");
    EXPECT_EQ(loaded.count("preview.limit"), 12);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(SettingsStore, MalformedFilesChangeNothing)
{
    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ not json";
    }

    SettingsStore store("test-app");
    declareSample(store);
    ASSERT_TRUE(store.assign("preview.limit", std::int64_t{7}));

    EXPECT_FALSE(store.read(filePath));
    EXPECT_EQ(store.count("preview.limit"), 7);
    EXPECT_FALSE(store.read(filePath.string() + ".missing"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(SettingsStore, SkipsUnknownAndMistypedEntries)
{
    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << R"({"preview": {"limit": 500, "enabled": "sometimes", "extra": true},
                   "notes": {"title": 3}, "search": 1})";
    }

    SettingsStore store("test-app");
    declareSample(store);
    ASSERT_TRUE(store.read(filePath));

    EXPECT_EQ(store.count("preview.limit"), 20);
    EXPECT_TRUE(store.flag("preview.enabled"));
    EXPECT_EQ(store.text("notes.title"), "3");
    EXPECT_FALSE(store.declared("preview.extra"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(SettingsStore, ExpandsHomeInPaths)
{
    SettingsStore store("test-app");
    store.declare({"notes", "directory", SettingKind::Path, std::string(), "Notes root"});

    EXPECT_TRUE(store.path("notes.directory").empty());
    EXPECT_FALSE(store.assign("notes.directory", std::int64_t{3}));

    ASSERT_TRUE(store.assign("notes.directory", std::string("/srv/notes")));
    EXPECT_EQ(store.path("notes.directory").string(), "/srv/notes");

    const char *home = std::getenv("HOME");
    if (!home || !*home)
        GTEST_SKIP() << "HOME is not set";
    ASSERT_TRUE(store.assign("notes.directory", std::string("~/notes")));
    EXPECT_EQ(store.path("notes.directory").string(), (std::filesystem::path(home) / "notes").string());
}

TEST(SettingsStore, UserSettingsLiveUnderAppDirectory)
{
    SettingsStore store("test-app");
    const auto path = store.userSettingsPath();
    EXPECT_EQ(path.filename().string(), "settings.json");
    EXPECT_EQ(path.parent_path().filename().string(), "test-app");
}
