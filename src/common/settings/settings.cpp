#include "lm/settings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>

namespace lm::config
{
namespace
{
namespace fs = std::filesystem;

std::optional<bool> readFlag(std::string_view word)
{
    static constexpr std::array<std::pair<std::string_view, bool>, 8> kWords{{{"true", true},
                                                                              {"yes", true},
                                                                              {"on", true},
                                                                              {"1", true},
                                                                              {"false", false},
                                                                              {"no", false},
                                                                              {"off", false},
                                                                              {"0", false}}};
    for (const auto &[spelling, meaning] : kWords)
    {
        if (spelling.size() != word.size())
            continue;
        if (std::equal(spelling.begin(), spelling.end(), word.begin(), [](char a, char b) {
                return a == std::tolower(static_cast<unsigned char>(b));
            }))
            return meaning;
    }
    return std::nullopt;
}

std::optional<std::int64_t> readCount(std::string_view digits)
{
    if (!digits.empty() && digits.front() == '+')
        digits.remove_prefix(1);
    std::int64_t parsed = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
    if (digits.empty() || ec != std::errc() || end != digits.data() + digits.size())
        return std::nullopt;
    return parsed;
}

std::optional<SettingValue> settingFromJson(const SettingSpec &spec, const nlohmann::json &entry)
{
    if (entry.is_boolean())
        return coerceSetting(spec, SettingValue(entry.get<bool>()));
    if (entry.is_number_integer())
        return coerceSetting(spec, SettingValue(entry.get<std::int64_t>()));
    if (entry.is_string())
        return coerceSetting(spec, SettingValue(entry.get<std::string>()));
    return std::nullopt;
}

nlohmann::json settingToJson(const SettingValue &value)
{
    if (auto *flag = std::get_if<bool>(&value))
        return *flag;
    if (auto *count = std::get_if<std::int64_t>(&value))
        return *count;
    if (auto *text = std::get_if<std::string>(&value))
        return *text;
    return nullptr;
}

fs::path homeDirectory()
{
    if (const char *home = std::getenv("HOME"); home && *home)
        return fs::path(home);
    return fs::path();
}

fs::path settingsRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / "livemark";
    const fs::path home = homeDirectory();
    if (!home.empty())
        return home / ".config" / "livemark";
    return fs::path(".config") / "livemark";
}

} // namespace

std::optional<SettingValue> coerceSetting(const SettingSpec &spec, const SettingValue &value)
{
    switch (spec.kind)
    {
    case SettingKind::Flag:
        if (auto *flag = std::get_if<bool>(&value))
            return SettingValue(*flag);
        if (auto *count = std::get_if<std::int64_t>(&value))
            return SettingValue(*count != 0);
        if (auto *text = std::get_if<std::string>(&value))
        {
            if (auto flag = readFlag(*text))
                return SettingValue(*flag);
        }
        return std::nullopt;
    case SettingKind::Count:
    {
        std::optional<std::int64_t> count;
        if (auto *number = std::get_if<std::int64_t>(&value))
            count = *number;
        else if (auto *text = std::get_if<std::string>(&value))
            count = readCount(*text);
        if (!count)
            return std::nullopt;
        return SettingValue(std::clamp(*count, spec.low, spec.high));
    }
    case SettingKind::Text:
        if (auto *text = std::get_if<std::string>(&value))
            return SettingValue(*text);
        if (auto *count = std::get_if<std::int64_t>(&value))
            return SettingValue(std::to_string(*count));
        return std::nullopt;
    case SettingKind::Path:
        if (auto *text = std::get_if<std::string>(&value))
            return SettingValue(*text);
        return std::nullopt;
    }
    return std::nullopt;
}

SettingsStore::SettingsStore(std::string appId)
    : id(std::move(appId))
{
}

void SettingsStore::declare(SettingSpec spec)
{
    if (spec.low > spec.high)
        std::swap(spec.low, spec.high);
    if (auto initial = coerceSetting(spec, spec.initial))
        spec.initial = std::move(*initial);

    const std::string key = spec.key();
    auto existing = std::find_if(declarations.begin(), declarations.end(),
                                 [&key](const SettingSpec &other) { return other.key() == key; });
    if (existing != declarations.end())
        *existing = std::move(spec);
    else
        declarations.push_back(std::move(spec));

    // An earlier assignment has to satisfy the new declaration.
    if (auto it = assigned.find(key); it != assigned.end())
    {
        const SettingSpec *current = find(key);
        if (auto coerced = coerceSetting(*current, it->second))
            it->second = std::move(*coerced);
        else
            assigned.erase(it);
    }
}

bool SettingsStore::declared(std::string_view key) const
{
    return find(key) != nullptr;
}

bool SettingsStore::assign(std::string_view key, const SettingValue &value)
{
    const SettingSpec *spec = find(key);
    if (!spec)
        return false;
    auto coerced = coerceSetting(*spec, value);
    if (!coerced)
        return false;
    assigned.insert_or_assign(std::string(key), std::move(*coerced));
    return true;
}

void SettingsStore::revert(std::string_view key)
{
    if (auto it = assigned.find(key); it != assigned.end())
        assigned.erase(it);
}

SettingValue SettingsStore::value(std::string_view key) const
{
    if (auto it = assigned.find(key); it != assigned.end())
        return it->second;
    if (const SettingSpec *spec = find(key))
        return spec->initial;
    return SettingValue();
}

bool SettingsStore::flag(std::string_view key) const
{
    const SettingValue current = value(key);
    const bool *flag = std::get_if<bool>(&current);
    return flag && *flag;
}

std::int64_t SettingsStore::count(std::string_view key) const
{
    const SettingValue current = value(key);
    const std::int64_t *count = std::get_if<std::int64_t>(&current);
    return count ? *count : 0;
}

std::string SettingsStore::text(std::string_view key) const
{
    SettingValue current = value(key);
    if (auto *text = std::get_if<std::string>(&current))
        return std::move(*text);
    return std::string();
}

fs::path SettingsStore::path(std::string_view key) const
{
    const std::string raw = text(key);
    if (raw == "~" || raw.rfind("~/", 0) == 0)
    {
        const fs::path home = homeDirectory();
        if (!home.empty())
            return raw.size() > 2 ? home / raw.substr(2) : home;
    }
    return fs::path(raw);
}

bool SettingsStore::read(const fs::path &file)
{
    std::ifstream in(file);
    if (!in)
        return false;

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object())
        return false;

    for (const SettingSpec &spec : declarations)
    {
        auto section = data.find(spec.section);
        if (section == data.end() || !section->is_object())
            continue;
        auto entry = section->find(spec.name);
        if (entry == section->end())
            continue;
        if (auto parsed = settingFromJson(spec, *entry))
            assigned.insert_or_assign(spec.key(), std::move(*parsed));
    }
    return true;
}

bool SettingsStore::write(const fs::path &file) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const SettingSpec &spec : declarations)
        data[spec.section][spec.name] = settingToJson(value(spec.key()));

    std::error_code ec;
    if (file.has_parent_path())
        fs::create_directories(file.parent_path(), ec);

    std::ofstream out(file);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool SettingsStore::readUserSettings()
{
    const fs::path file = userSettingsPath();
    std::error_code ec;
    if (!fs::exists(file, ec))
        return false;
    return read(file);
}

bool SettingsStore::writeUserSettings() const
{
    return write(userSettingsPath());
}

fs::path SettingsStore::userSettingsPath() const
{
    return settingsRoot() / id / "settings.json";
}

const SettingSpec *SettingsStore::find(std::string_view key) const
{
    const std::size_t dot = key.find('.');
    if (dot == std::string_view::npos)
        return nullptr;
    const std::string_view section = key.substr(0, dot);
    const std::string_view name = key.substr(dot + 1);
    auto it = std::find_if(declarations.begin(), declarations.end(), [&](const SettingSpec &spec) {
        return spec.section == section && spec.name == name;
    });
    return it == declarations.end() ? nullptr : &*it;
}

} // namespace lm::config
