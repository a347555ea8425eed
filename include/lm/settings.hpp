#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lm::config
{

enum class SettingKind
{
    Flag,
    Count,
    Text,
    Path
};

// Text and Path settings both hold a std::string.
using SettingValue = std::variant<std::monostate, bool, std::int64_t, std::string>;

// A setting lives in a section and is addressed as "section.name". Count
// settings are clamped into [low, high].
struct SettingSpec
{
    std::string section;
    std::string name;
    SettingKind kind = SettingKind::Text;
    SettingValue initial;
    std::string help;
    std::int64_t low = std::numeric_limits<std::int64_t>::min();
    std::int64_t high = std::numeric_limits<std::int64_t>::max();

    std::string key() const { return section + "." + name; }
};

// Converts |value| to the representation of |spec|, or nullopt when it has
// no sensible reading ("many" for a Count, 3 for a Path).
std::optional<SettingValue> coerceSetting(const SettingSpec &spec, const SettingValue &value);

// Settings of one application. The file form nests settings by section:
// {"preview": {"livePreview": true}, "notes": {"directory": "~/notes"}}.
class SettingsStore
{
public:
    explicit SettingsStore(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void declare(SettingSpec spec);
    bool declared(std::string_view key) const;
    // Declaration order, which is also the order of the usage text.
    const std::vector<SettingSpec> &specs() const noexcept { return declarations; }

    // Returns false, leaving the setting alone, for an undeclared key or a
    // value that cannot be coerced.
    bool assign(std::string_view key, const SettingValue &value);
    void revert(std::string_view key);
    void revertAll() noexcept { assigned.clear(); }

    SettingValue value(std::string_view key) const;
    bool flag(std::string_view key) const;
    std::int64_t count(std::string_view key) const;
    std::string text(std::string_view key) const;
    // Expands a leading "~" to $HOME. Empty when the setting is empty.
    std::filesystem::path path(std::string_view key) const;

    // A missing or malformed file leaves every setting untouched. Entries
    // that are unknown or of the wrong type are skipped.
    bool read(const std::filesystem::path &file);
    bool write(const std::filesystem::path &file) const;

    bool readUserSettings();
    bool writeUserSettings() const;
    std::filesystem::path userSettingsPath() const;

private:
    const SettingSpec *find(std::string_view key) const;

    std::string id;
    std::vector<SettingSpec> declarations;
    std::map<std::string, SettingValue, std::less<>> assigned;
};

} // namespace lm::config
