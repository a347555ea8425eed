#include "lm/preview/preview_controller.hpp"

#include "lm/preview/decoration_builder.hpp"
#include "lm/preview/line_patterns.hpp"
#include "lm/preview/widgets.hpp"
#include "lm/wiki/wiki_links.hpp"

#include <algorithm>

namespace lm::preview
{
namespace
{
bool insideFencedCode(SyntaxTreeProvider &provider, const text::TextSource &source, const text::LineInfo &line)
{
    for (const auto &node : provider.nodesInRange(source, text::TextRange{line.from, line.to}))
    {
        if (node.kind == SyntaxNodeKind::FencedCode && node.from <= line.from && node.to >= line.to)
            return true;
    }
    return false;
}

// Task marker on a raw line: the caret line has no widgets, so activation
// there looks at the "- [ ]" prefix itself. Code blocks are literal text.
bool offsetOnRawTaskMarker(SyntaxTreeProvider &provider, const text::TextSource &source, std::size_t offset)
{
    const text::LineInfo line = source.lineAt(offset);
    auto column = matchTaskState(source.lineText(line));
    if (!column || offset > line.from + *column + 2)
        return false;
    return !insideFencedCode(provider, source, line);
}

} // namespace

PreviewController::PreviewController(text::EditorHost &editorHost,
                                     SyntaxTreeProvider &treeProvider,
                                     PreviewSettings settings)
    : host(editorHost),
      provider(treeProvider),
      current(settings)
{
}

void PreviewController::setSettings(const PreviewSettings &value)
{
    current = value;
    current.maxCompletions = std::max<std::size_t>(current.maxCompletions, 1);
    invalidate(InvalidationReason::SettingsChanged);
}

void PreviewController::setNavigateCallback(NavigateCallback callback)
{
    navigate = std::move(callback);
}

void PreviewController::setTitleIndex(wiki::NoteTitleIndex index)
{
    titles = std::move(index);
}

void PreviewController::invalidate(InvalidationReason reason)
{
    if (reason == InvalidationReason::CaretMoved && built && revision == host.text().revision())
    {
        // Moving within the same line changes nothing that is drawn.
        const text::TextSource &source = host.text();
        const std::size_t caret = std::min(host.caret(), source.length());
        const std::size_t previous = std::min(builtCaret, source.length());
        if (source.lineAt(caret).from == source.lineAt(previous).from && host.viewport() == builtViewport)
        {
            builtCaret = host.caret();
            return;
        }
    }
    rebuild();
}

void PreviewController::rebuild()
{
    const text::TextSource &source = host.text();
    const text::TextRange viewport = host.viewport();
    const std::size_t caret = host.caret();

    if (current.livePreview)
        markdown = buildMarkdownDecorations(source, provider, viewport, caret);
    else
        markdown.clear();

    if (current.wikiLinks)
        wikiLinks = wiki::buildWikiLinkDecorations(source, viewport, caret);
    else
        wikiLinks.clear();

    revision = source.revision();
    builtCaret = caret;
    builtViewport = viewport;
    built = true;
    ++passes;
}

void PreviewController::refreshIfStale()
{
    if (!built || revision != host.text().revision() || builtCaret != host.caret() ||
        builtViewport != host.viewport())
        rebuild();
}

ActivationResult PreviewController::activateAt(std::size_t offset)
{
    refreshIfStale();
    const text::TextSource &source = host.text();
    if (offset > source.length())
        return ActivationResult::None;

    const DecorationInstruction *instruction = widgetAt(markdown, offset);
    if (instruction && instruction->widget->kind == WidgetKind::Checkbox)
    {
        auto transaction = checkboxToggle(source, *instruction->widget);
        if (!transaction || !host.dispatch(*transaction))
            return ActivationResult::None;
        invalidate(InvalidationReason::DocumentChanged);
        return ActivationResult::CheckboxToggled;
    }

    if (current.wikiLinks)
    {
        if (auto title = wiki::resolveWikiLinkAt(source, wikiLinks, offset))
        {
            if (navigate)
                navigate(*title);
            return ActivationResult::WikiLinkFollowed;
        }
    }

    if (current.livePreview && offsetOnRawTaskMarker(provider, source, offset))
    {
        auto transaction = toggleTaskAt(source, offset);
        if (!transaction || !host.dispatch(*transaction))
            return ActivationResult::None;
        invalidate(InvalidationReason::DocumentChanged);
        return ActivationResult::CheckboxToggled;
    }
    return ActivationResult::None;
}

std::optional<wiki::CompletionResult> PreviewController::completionsAt(
    std::chrono::system_clock::time_point now) const
{
    if (!current.wikiLinks)
        return std::nullopt;
    return wiki::completeWikiLink(host.text(), host.caret(), titles, current.maxCompletions, now);
}

bool PreviewController::acceptCompletion(const wiki::CompletionResult &result, std::size_t optionIndex)
{
    if (optionIndex >= result.options.size())
        return false;
    if (result.to > host.text().length() || result.to != host.caret())
        return false;
    auto transaction = wiki::completionTransaction(result, result.options[optionIndex]);
    if (!transaction || !host.dispatch(*transaction))
        return false;
    invalidate(InvalidationReason::DocumentChanged);
    return true;
}

} // namespace lm::preview
