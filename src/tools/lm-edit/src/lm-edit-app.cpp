#include "lm/edit/editor_options.hpp"
#include "lm/edit/markdown_editor.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{

void printUsage(const lm::config::SettingsStore &store)
{
    std::cout << lm::edit::kAppId << " - " << lm::edit::kAppShortDescription << "\n\n"
              << "Usage: " << lm::edit::kAppId << " [options] [FILE...]\n"
              << "  --notes DIR            Resolve wiki links against notes in DIR\n"
              << "  --load-options FILE    Load settings from FILE\n"
              << "  --no-default-options   Do not load saved settings\n\n"
              << "Each FILE is opened in its own window.\n\n"
              << "Settings (" << store.userSettingsPath().string() << "):\n";
    for (const auto &spec : store.specs())
        std::cout << "  " << spec.key() << "\n      " << spec.help << "\n";
    std::cout << std::flush;
}

// Accepts "--name VALUE" and "--name=VALUE".
std::optional<std::string> takeValue(const std::string &arg, const std::string &name, int &i, int argc, char **argv)
{
    const std::string prefix = name + "=";
    if (arg == name)
    {
        if (i + 1 >= argc)
            return std::nullopt;
        return std::string(argv[++i]);
    }
    if (arg.size() > prefix.size() && arg.rfind(prefix, 0) == 0)
        return arg.substr(prefix.size());
    return std::nullopt;
}

} // namespace

int main(int argc, char **argv)
{
    using namespace lm;

    auto store = std::make_shared<config::SettingsStore>(std::string(edit::kAppId));
    edit::declareEditorSettings(*store);

    bool loadDefaults = true;
    std::vector<std::filesystem::path> optionFiles;
    std::optional<std::string> notesOverride;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(*store);
            return 0;
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg.rfind("--load-options", 0) == 0)
        {
            auto value = takeValue(arg, "--load-options", i, argc, argv);
            if (!value)
            {
                std::cerr << "lm-edit: --load-options requires a file path" << std::endl;
                return 1;
            }
            optionFiles.emplace_back(*value);
        }
        else if (arg.rfind("--notes", 0) == 0)
        {
            auto value = takeValue(arg, "--notes", i, argc, argv);
            if (!value)
            {
                std::cerr << "lm-edit: --notes requires a directory" << std::endl;
                return 1;
            }
            notesOverride = *value;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << "lm-edit: unknown option '" << arg << "'" << std::endl;
            return 1;
        }
        else
        {
            files.push_back(arg);
        }
    }

    if (loadDefaults)
        store->readUserSettings();
    for (const auto &file : optionFiles)
    {
        if (!store->read(file))
        {
            std::cerr << "lm-edit: failed to load settings from '" << file.string() << "'" << std::endl;
            return 1;
        }
    }

    if (notesOverride)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(*notesOverride, ec))
        {
            std::cerr << "lm-edit: notes directory '" << *notesOverride << "' does not exist" << std::endl;
            return 1;
        }
        store->assign(edit::kSettingNotesDirectory, *notesOverride);
    }

    edit::MarkdownEditorApp app(store, files);
    app.run();
    app.shutDown();
    return 0;
}
