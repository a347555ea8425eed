#pragma once

#include "lm/preview/decoration.hpp"
#include "lm/preview/syntax_tree.hpp"
#include "lm/text/editor_host.hpp"
#include "lm/wiki/autocomplete.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lm::preview
{

enum class InvalidationReason
{
    DocumentChanged,
    ViewportChanged,
    CaretMoved,
    SettingsChanged
};

struct PreviewSettings
{
    bool livePreview = true;
    bool wikiLinks = true;
    std::size_t maxCompletions = wiki::kDefaultCompletionLimit;
};

enum class ActivationResult
{
    None,
    CheckboxToggled,
    WikiLinkFollowed
};

// Owns the two decoration layers of one editor and routes activations and
// completion requests to the matching component.
class PreviewController
{
public:
    using NavigateCallback = std::function<void(const std::string &)>;

    PreviewController(text::EditorHost &host, SyntaxTreeProvider &provider, PreviewSettings settings = {});

    void setSettings(const PreviewSettings &value);
    const PreviewSettings &settings() const noexcept { return current; }

    void setNavigateCallback(NavigateCallback callback);
    void setTitleIndex(wiki::NoteTitleIndex index);
    const wiki::NoteTitleIndex &titleIndex() const noexcept { return titles; }

    void invalidate(InvalidationReason reason);
    // Rebuilds when revision, caret or viewport differ from the last pass.
    void refreshIfStale();

    const DecorationLayer &markdownLayer() const noexcept { return markdown; }
    const DecorationLayer &wikiLayer() const noexcept { return wikiLinks; }
    std::uint64_t builtRevision() const noexcept { return revision; }
    std::size_t passCount() const noexcept { return passes; }

    ActivationResult activateAt(std::size_t offset);

    std::optional<wiki::CompletionResult> completionsAt(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
    bool acceptCompletion(const wiki::CompletionResult &result, std::size_t optionIndex);

private:
    void rebuild();

    text::EditorHost &host;
    SyntaxTreeProvider &provider;
    PreviewSettings current;
    NavigateCallback navigate;
    wiki::NoteTitleIndex titles;
    DecorationLayer markdown;
    DecorationLayer wikiLinks;
    std::uint64_t revision = 0;
    std::size_t builtCaret = 0;
    text::TextRange builtViewport;
    bool built = false;
    std::size_t passes = 0;
};

} // namespace lm::preview
