#include "lm/edit/markdown_editor.hpp"

#include "lm/preview/decoration.hpp"
#include "lm/preview/widgets.hpp"
#include "lm/wiki/wiki_links.hpp"

#define Uses_TText
#include <tvision/tv.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string_view>

namespace lm::edit
{
    namespace
    {
        constexpr int kTabWidth = 8;
        constexpr int kMaxCompletionRows = 8;
        constexpr std::size_t kNoOffset = std::numeric_limits<std::size_t>::max();

        using StyleMask = std::uint32_t;

        constexpr StyleMask kStyleBold = 1u << 0;
        constexpr StyleMask kStyleItalic = 1u << 1;
        constexpr StyleMask kStyleStrikethrough = 1u << 2;
        constexpr StyleMask kStyleCode = 1u << 3;
        constexpr StyleMask kStyleLink = 1u << 4;
        constexpr StyleMask kStyleQuote = 1u << 5;
        constexpr StyleMask kStyleTaskDone = 1u << 6;
        constexpr StyleMask kStyleWikiLink = 1u << 7;
        constexpr StyleMask kStyleWikiBracket = 1u << 8;
        constexpr StyleMask kStyleMarker = 1u << 9;
        constexpr StyleMask kStyleRule = 1u << 10;
        constexpr StyleMask kStyleMatch = 1u << 11;
        constexpr StyleMask kStyleHeadingShift = 16;
        constexpr StyleMask kStyleHeadingMask = 0x7u << kStyleHeadingShift;

        StyleMask styleForClass(std::string_view styleClass)
        {
            namespace style = preview::style;
            if (int level = style::headingLevelOfClass(styleClass); level > 0)
                return static_cast<StyleMask>(level) << kStyleHeadingShift;
            if (styleClass == style::kBold)
                return kStyleBold;
            if (styleClass == style::kItalic)
                return kStyleItalic;
            if (styleClass == style::kStrikethrough)
                return kStyleStrikethrough;
            if (styleClass == style::kCode)
                return kStyleCode;
            if (styleClass == style::kLink)
                return kStyleLink;
            if (styleClass == style::kBlockquoteLine)
                return kStyleQuote;
            if (styleClass == style::kTaskChecked)
                return kStyleTaskDone;
            if (styleClass == style::kWikiLink)
                return kStyleWikiLink;
            if (styleClass == style::kWikiLinkBracket)
                return kStyleWikiBracket;
            return 0;
        }

        StyleMask styleForWidget(const preview::Widget &widget)
        {
            switch (widget.kind)
            {
            case preview::WidgetKind::Checkbox:
            case preview::WidgetKind::ListMarker:
                return kStyleMarker;
            case preview::WidgetKind::HorizontalRule:
                return kStyleRule;
            case preview::WidgetKind::WikiLink:
                return kStyleWikiLink;
            }
            return 0;
        }

        void addStyle(TColorAttr &attr, ushort style)
        {
            setStyle(attr, static_cast<ushort>(getStyle(attr) | style));
        }

        TColorAttr applyStyleToAttr(TColorAttr base, StyleMask mask)
        {
            TColorAttr attr = base;
            int fg = -1;
            int bg = -1;

            auto chooseFg = [&](int code)
            {
                if (fg == -1)
                    fg = code;
            };

            const int headingLevel = static_cast<int>((mask & kStyleHeadingMask) >> kStyleHeadingShift);
            if (headingLevel == 1)
                addStyle(attr, slBold | slUnderline);
            else if (headingLevel == 2)
                addStyle(attr, slBold);
            else if (headingLevel > 2)
                addStyle(attr, slBold | slItalic);
            if (headingLevel > 0)
                chooseFg(0x0F);

            if (mask & kStyleCode)
            {
                chooseFg(0x0A);
                bg = 0x01;
            }
            if (mask & (kStyleLink | kStyleWikiLink))
            {
                chooseFg(0x09);
                addStyle(attr, slUnderline);
            }
            if (mask & kStyleWikiBracket)
                chooseFg(0x08);
            if (mask & kStyleQuote)
                chooseFg(0x0B);
            if (mask & (kStyleStrikethrough | kStyleTaskDone))
            {
                chooseFg(0x08);
                addStyle(attr, slStrike);
            }
            if (mask & kStyleItalic)
                addStyle(attr, slItalic);
            if (mask & kStyleBold)
                addStyle(attr, slBold);
            if (mask & kStyleMarker)
                fg = 0x0E;
            if (mask & kStyleRule)
                chooseFg(0x08);
            if (mask & kStyleMatch)
            {
                fg = 0x00;
                bg = 0x06;
            }

            if (fg != -1)
                setFore(attr, TColorDesired(TColorBIOS(fg)));
            if (bg != -1)
                setBack(attr, TColorDesired(TColorBIOS(bg)));
            return attr;
        }

        TStringView view(const std::string &text) noexcept
        {
            return TStringView(text.data(), text.size());
        }

        std::size_t utf8SequenceLength(char lead) noexcept
        {
            const auto ch = static_cast<unsigned char>(lead);
            if (ch < 0x80)
                return 1;
            if ((ch & 0xE0) == 0xC0)
                return 2;
            if ((ch & 0xF0) == 0xE0)
                return 3;
            if ((ch & 0xF8) == 0xF0)
                return 4;
            return 1;
        }

        // Zero-width sequences join the previous cell.
        template <typename Cell>
        void appendGlyph(std::vector<Cell> &cells, std::string glyph, TColorAttr attr, std::size_t offset)
        {
            const int width = static_cast<int>(TText::width(view(glyph)));
            if (width <= 0 && !cells.empty())
            {
                cells.back().glyph += glyph;
                return;
            }
            Cell cell;
            cell.glyph = std::move(glyph);
            cell.width = std::max(width, 1);
            cell.attr = attr;
            cell.offset = offset;
            cells.push_back(std::move(cell));
        }

        void collectInstructions(const preview::DecorationLayer &layer, const text::LineInfo &line,
                                 StyleMask &lineStyle, std::vector<StyleMask> &styles,
                                 std::vector<const preview::DecorationInstruction *> &replacing)
        {
            for (const auto &instruction : layer)
            {
                if (instruction.range.from > line.to)
                    break;
                if (instruction.range.to < line.from)
                    continue;
                if (instruction.lineLevel)
                {
                    if (instruction.range.from == line.from)
                        lineStyle |= styleForClass(instruction.styleClass);
                    continue;
                }
                if (instruction.replaces())
                {
                    if (instruction.range.from >= line.from)
                        replacing.push_back(&instruction);
                    continue;
                }
                const StyleMask mask = styleForClass(instruction.styleClass);
                const std::size_t from = std::max(instruction.range.from, line.from) - line.from;
                const std::size_t to = std::min(instruction.range.to, line.to) - line.from;
                for (std::size_t i = from; i < to && i < styles.size(); ++i)
                    styles[i] |= mask;
            }
        }

    } // namespace

    LivePreviewEditor::LivePreviewEditor(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll,
                                         TIndicator *indicator, TStringView fileName) noexcept
        : TFileEditor(bounds, hScroll, vScroll, indicator, fileName),
          controller(*this, treeProvider),
          bufferSearch(*this)
    {
        syncDocument();
    }

    text::TextRange LivePreviewEditor::viewport() const
    {
        const std::size_t lines = document.lineCount();
        const std::size_t first = std::min<std::size_t>(static_cast<std::size_t>(std::max(delta.y, 0)), lines - 1);
        const std::size_t last = std::min<std::size_t>(first + static_cast<std::size_t>(std::max(size.y, 1)) - 1,
                                                       lines - 1);
        return text::TextRange{document.line(first).from, document.line(last).to};
    }

    class LivePreviewEditor::GapBuffer : public text::EditBuffer
    {
    public:
        explicit GapBuffer(LivePreviewEditor &editor) noexcept
            : editor(editor)
        {
        }

        std::size_t size() const override { return editor.bufLen; }
        bool reserve(std::size_t capacity) override
        {
            return capacity <= std::numeric_limits<uint>::max() &&
                   editor.setBufSize(static_cast<uint>(capacity));
        }
        void erase(std::size_t from, std::size_t to) override
        {
            editor.setCurPtr(static_cast<uint>(from), 0);
            editor.deleteRange(static_cast<uint>(from), static_cast<uint>(to), False);
        }
        bool insert(std::size_t at, std::string_view text) override
        {
            editor.setCurPtr(static_cast<uint>(at), 0);
            return editor.insertText(text.data(), static_cast<uint>(text.size()), False);
        }

    private:
        LivePreviewEditor &editor;
    };

    bool LivePreviewEditor::dispatch(const text::EditTransaction &transaction)
    {
        if (!text::changesAreValid(transaction.changes, document.length()))
            return false;

        const std::size_t previousCaret = curPtr;
        const std::string previous = document.text();
        lock();
        GapBuffer buffer(*this);
        const bool applied = text::applyOrRestore(buffer, transaction, previous);
        if (!applied)
            setCurPtr(static_cast<uint>(std::min(previousCaret, previous.size())), 0);
        syncDocument();
        if (applied)
        {
            if (transaction.selection)
            {
                const text::Selection &selection = *transaction.selection;
                const uint from = static_cast<uint>(std::min(selection.from(), document.length()));
                const uint to = static_cast<uint>(std::min(selection.to(), document.length()));
                setSelect(from, to, Boolean(selection.head < selection.anchor));
            }
            else
            {
                const std::size_t mapped = text::mapThroughChanges(transaction.changes, previousCaret);
                setCurPtr(static_cast<uint>(std::min(mapped, document.length())), 0);
            }
            trackCursor(False);
        }
        unlock();

        controller.invalidate(preview::InvalidationReason::DocumentChanged);
        drawView();
        return applied;
    }

    void LivePreviewEditor::setSelection(std::size_t anchor, std::size_t head)
    {
        anchor = std::min(anchor, document.length());
        head = std::min(head, document.length());
        lock();
        setSelect(static_cast<uint>(std::min(anchor, head)), static_cast<uint>(std::max(anchor, head)),
                  Boolean(head < anchor));
        unlock();
        controller.invalidate(preview::InvalidationReason::CaretMoved);
        drawView();
    }

    void LivePreviewEditor::scrollIntoView(std::size_t pos)
    {
        pos = std::min(pos, document.length());
        const text::LineInfo line = document.lineAt(pos);
        const int row = static_cast<int>(line.number);
        const int column = static_cast<int>(charPos(static_cast<uint>(line.from), static_cast<uint>(pos)));

        int x = delta.x;
        int y = delta.y;
        if (row < delta.y || row >= delta.y + size.y)
            y = std::max(0, row - size.y / 2);
        if (column < delta.x || column >= delta.x + size.x)
            x = std::max(0, column - size.x / 2);
        if (x == delta.x && y == delta.y)
            return;
        scrollTo(x, y);
        controller.invalidate(preview::InvalidationReason::ViewportChanged);
        drawView();
    }

    void LivePreviewEditor::applySettings(const preview::PreviewSettings &settings)
    {
        controller.setSettings(settings);
        refreshCompletion();
        drawView();
    }

    void LivePreviewEditor::applyInline(InlineCommand command)
    {
        const std::size_t head = curPtr;
        const std::size_t anchor = curPtr == selStart ? selEnd : selStart;
        dispatch(applyInlineCommand(document, text::Selection{anchor, head}, command));
    }

    preview::ActivationResult LivePreviewEditor::activateAtCaret()
    {
        const preview::ActivationResult result = controller.activateAt(caret());
        if (result != preview::ActivationResult::None)
            drawView();
        return result;
    }

    std::vector<std::string> LivePreviewEditor::outgoingLinks() const
    {
        return wiki::extractWikiLinks(document.text());
    }

    void LivePreviewEditor::closeCompletion()
    {
        if (!completion)
            return;
        dismissedCompletionAt = completion->from;
        completion.reset();
        drawView();
    }

    void LivePreviewEditor::setSearchHighlight(bool enabled)
    {
        if (highlightMatches == enabled)
            return;
        highlightMatches = enabled;
        drawView();
    }

    LivePreviewEditor::BufferSnapshot LivePreviewEditor::snapshot() const noexcept
    {
        BufferSnapshot state;
        state.insCount = insCount;
        state.delCount = delCount;
        state.bufLen = bufLen;
        state.curPtr = curPtr;
        state.modified = modified;
        state.delta = delta;
        return state;
    }

    void LivePreviewEditor::syncDocument()
    {
        std::string content;
        content.reserve(bufLen);
        for (uint i = 0; i < bufLen; ++i)
            content.push_back(bufChar(i));
        const std::string &previous = document.text();
        if (content == previous)
            return;
        const auto mismatch = std::mismatch(content.begin(), content.end(), previous.begin(), previous.end());
        treeProvider.invalidateFrom(static_cast<std::size_t>(mismatch.first - content.begin()));
        document.reset(std::move(content));
    }

    void LivePreviewEditor::afterBufferEvent(const BufferSnapshot &before)
    {
        const bool contentChanged = insCount != before.insCount || delCount != before.delCount ||
                                    bufLen != before.bufLen || modified != before.modified;
        const bool caretMoved = curPtr != before.curPtr;
        const bool scrolled = delta != before.delta;
        if (!contentChanged && !caretMoved && !scrolled)
            return;

        const std::uint64_t revisionBefore = document.revision();
        const std::size_t passesBefore = controller.passCount();
        const bool hadCompletion = completion.has_value();

        if (contentChanged)
            syncDocument();
        if (document.revision() != revisionBefore)
            controller.invalidate(preview::InvalidationReason::DocumentChanged);
        else if (scrolled)
            controller.invalidate(preview::InvalidationReason::ViewportChanged);
        else if (caretMoved)
            controller.invalidate(preview::InvalidationReason::CaretMoved);

        if (document.revision() != revisionBefore || caretMoved)
            refreshCompletion();

        if (controller.passCount() != passesBefore || hadCompletion || completion)
            drawView();
    }

    void LivePreviewEditor::refreshCompletion()
    {
        auto result = controller.completionsAt();
        if (!result || result->options.empty())
        {
            completion.reset();
            dismissedCompletionAt.reset();
            return;
        }
        if (dismissedCompletionAt && *dismissedCompletionAt == result->from)
        {
            completion.reset();
            return;
        }
        dismissedCompletionAt.reset();

        const bool sameSession = completion && completion->from == result->from;
        completion = std::move(result);
        if (!sameSession || completionIndex >= completion->options.size())
            completionIndex = 0;
    }

    bool LivePreviewEditor::handleCompletionKey(TEvent &event)
    {
        if (!completion || event.what != evKeyDown)
            return false;

        const std::size_t count = completion->options.size();
        switch (event.keyDown.keyCode)
        {
        case kbUp:
            completionIndex = (completionIndex + count - 1) % count;
            break;
        case kbDown:
            completionIndex = (completionIndex + 1) % count;
            break;
        case kbEnter:
        case kbTab:
        {
            const wiki::CompletionResult result = *completion;
            completion.reset();
            if (result.options[completionIndex].actionable)
                controller.acceptCompletion(result, completionIndex);
            else
                dismissedCompletionAt = result.from;
            break;
        }
        case kbEsc:
            dismissedCompletionAt = completion->from;
            completion.reset();
            break;
        default:
            return false;
        }
        drawView();
        clearEvent(event);
        return true;
    }

    std::optional<std::size_t> LivePreviewEditor::offsetAt(TPoint local) const
    {
        if (local.y < 0 || local.x < 0 || local.y >= static_cast<int>(rowMaps.size()))
            return std::nullopt;
        const RowMap &map = rowMaps[static_cast<std::size_t>(local.y)];
        if (!map.decorated || local.x >= static_cast<int>(map.offsets.size()))
            return std::nullopt;
        const std::size_t offset = map.offsets[static_cast<std::size_t>(local.x)];
        if (offset == kNoOffset)
            return std::nullopt;
        return offset;
    }

    // Rows that replace text need their own column mapping; everything else
    // keeps the stock mouse handling (drag selection, double clicks).
    bool LivePreviewEditor::handlePreviewClick(TEvent &event)
    {
        if (event.what != evMouseDown || (state & sfSelected) == 0)
            return false;
        if ((event.mouse.buttons & mbLeftButton) == 0 || (event.mouse.eventFlags & meDoubleClick) != 0)
            return false;

        auto offset = offsetAt(makeLocal(event.mouse.where));
        if (!offset)
            return false;

        if (controller.activateAt(*offset) == preview::ActivationResult::None)
        {
            lock();
            setCurPtr(static_cast<uint>(std::min(*offset, document.length())), 0);
            unlock();
            controller.invalidate(preview::InvalidationReason::CaretMoved);
            refreshCompletion();
        }
        drawView();
        clearEvent(event);
        return true;
    }

    void LivePreviewEditor::handleEvent(TEvent &event)
    {
        if (handleCompletionKey(event))
            return;
        if (handlePreviewClick(event))
            return;

        if (event.what == evKeyDown && event.keyDown.keyCode == kbCtrlEnter)
        {
            activateAtCaret();
            clearEvent(event);
            return;
        }

        if (event.what == evCommand)
        {
            switch (event.message.command)
            {
            case cmSave:
                if (hostWindow)
                    hostWindow->saveDocument(false);
                else
                    save();
                clearEvent(event);
                return;
            case cmSaveAs:
                if (hostWindow)
                    hostWindow->saveDocument(true);
                else
                    saveAs();
                clearEvent(event);
                return;
            case cmBold:
                applyInline(InlineCommand::Bold);
                clearEvent(event);
                return;
            case cmItalic:
                applyInline(InlineCommand::Italic);
                clearEvent(event);
                return;
            case cmInlineCode:
                applyInline(InlineCommand::InlineCode);
                clearEvent(event);
                return;
            case cmInsertLink:
                applyInline(InlineCommand::Link);
                clearEvent(event);
                return;
            case cmActivate:
                activateAtCaret();
                clearEvent(event);
                return;
            default:
                break;
            }
        }

        const BufferSnapshot before = snapshot();
        TFileEditor::handleEvent(event);
        afterBufferEvent(before);
    }

    std::vector<LivePreviewEditor::Cell> LivePreviewEditor::layoutLine(const text::LineInfo &line,
                                                                       TAttrPair colors,
                                                                       bool &decorated) const
    {
        const std::string content = document.lineText(line);
        std::vector<StyleMask> styles(content.size(), 0);
        StyleMask lineStyle = 0;
        std::vector<const preview::DecorationInstruction *> replacing;

        collectInstructions(controller.markdownLayer(), line, lineStyle, styles, replacing);
        collectInstructions(controller.wikiLayer(), line, lineStyle, styles, replacing);
        std::sort(replacing.begin(), replacing.end(),
                  [](const preview::DecorationInstruction *a, const preview::DecorationInstruction *b) {
                      return a->range.from < b->range.from;
                  });
        decorated = !replacing.empty();

        if (highlightMatches)
        {
            for (const auto &match : bufferSearch.matches())
            {
                if (match.to <= line.from || match.from > line.to)
                    continue;
                const std::size_t from = std::max(match.from, line.from) - line.from;
                const std::size_t to = std::min(match.to, line.to) - line.from;
                for (std::size_t i = from; i < to; ++i)
                    styles[i] |= kStyleMatch;
            }
        }

        const std::size_t selectionFrom = selStart;
        const std::size_t selectionTo = selEnd;
        auto attrAt = [&](std::size_t offset, StyleMask mask) {
            if (offset >= selectionFrom && offset < selectionTo)
                return colors[1];
            return applyStyleToAttr(colors[0], mask);
        };

        std::vector<Cell> cells;
        int column = 0;
        auto next = replacing.begin();
        std::size_t i = 0;
        while (i < content.size())
        {
            const std::size_t offset = line.from + i;
            while (next != replacing.end() && (*next)->range.from < offset)
                ++next;
            if (next != replacing.end() && (*next)->range.from == offset)
            {
                const preview::DecorationInstruction &instruction = **next;
                ++next;
                if (instruction.kind == preview::DecorationKind::ReplaceWithWidget && instruction.widget)
                {
                    const int ruleWidth = std::max(3, size.x - column);
                    const std::string glyphs = preview::renderText(*instruction.widget, ruleWidth);
                    const TColorAttr attr = attrAt(offset, styleForWidget(*instruction.widget));
                    for (std::size_t g = 0; g < glyphs.size();)
                    {
                        const std::size_t length = std::min(utf8SequenceLength(glyphs[g]), glyphs.size() - g);
                        appendGlyph(cells, glyphs.substr(g, length), attr, offset);
                        column += cells.back().width;
                        g += length;
                    }
                }
                const std::size_t stop = std::min(instruction.range.to, line.to) - line.from;
                if (stop > i)
                    i = stop;
                continue;
            }

            const char ch = content[i];
            const TColorAttr attr = attrAt(offset, lineStyle | styles[i]);
            if (ch == '\t')
            {
                const int spaces = kTabWidth - column % kTabWidth;
                for (int s = 0; s < spaces; ++s)
                    appendGlyph(cells, std::string(1, ' '), attr, offset);
                column += spaces;
                ++i;
                continue;
            }
            if (ch == '\r' && i + 1 == content.size())
                break;

            const std::size_t length = std::min(utf8SequenceLength(ch), content.size() - i);
            const std::size_t before = cells.size();
            appendGlyph(cells, content.substr(i, length), attr, offset);
            if (cells.size() != before)
                column += cells.back().width;
            i += length;
        }
        return cells;
    }

    void LivePreviewEditor::drawRow(int row, const std::vector<Cell> &cells, std::size_t lineEnd,
                                    TColorAttr blank, bool decorated)
    {
        TDrawBuffer buffer;
        buffer.moveChar(0, ' ', blank, size.x);

        RowMap &map = rowMaps[static_cast<std::size_t>(row)];
        map.decorated = decorated;
        map.offsets.assign(static_cast<std::size_t>(std::max(size.x, 0)), lineEnd);

        int column = 0;
        for (const auto &cell : cells)
        {
            const int start = column;
            column += cell.width;
            if (start < delta.x)
                continue;
            const int x = start - delta.x;
            if (x >= size.x)
                break;
            buffer.moveStr(static_cast<ushort>(x), view(cell.glyph), cell.attr);
            for (int k = 0; k < cell.width && x + k < size.x; ++k)
                map.offsets[static_cast<std::size_t>(x + k)] = cell.offset;
        }
        writeLine(0, row, size.x, 1, buffer);
    }

    void LivePreviewEditor::drawCompletion()
    {
        if (!completion || completion->options.empty() || size.x <= 4)
            return;

        const int count = static_cast<int>(completion->options.size());
        const int visible = std::min({count, kMaxCompletionRows, std::max(size.y - 1, 1)});
        int width = 0;
        for (const auto &option : completion->options)
        {
            const int labelWidth = static_cast<int>(TText::width(view(option.label)));
            const int detailWidth = static_cast<int>(TText::width(view(option.detail)));
            width = std::max(width, labelWidth + (detailWidth > 0 ? detailWidth + 2 : 0) + 2);
        }
        width = std::min(width, size.x);

        const int caretRow = curPos.y - delta.y;
        const int caretColumn = curPos.x - delta.x;
        int top = caretRow + 1;
        if (top + visible > size.y)
            top = std::max(0, caretRow - visible);
        const int left = std::clamp(caretColumn, 0, std::max(0, size.x - width));

        const int selected = static_cast<int>(completionIndex);
        const int first = selected >= visible ? selected - visible + 1 : 0;

        const TColorAttr normal{TColorBIOS(0x0), TColorBIOS(0x3)};
        const TColorAttr highlight{TColorBIOS(0xF), TColorBIOS(0x2)};
        for (int row = 0; row < visible; ++row)
        {
            const int index = first + row;
            const auto &option = completion->options[static_cast<std::size_t>(index)];
            TColorAttr attr = index == selected ? highlight : normal;
            if (!option.actionable)
                addStyle(attr, slItalic);

            TDrawBuffer buffer;
            buffer.moveChar(0, ' ', attr, static_cast<ushort>(width));
            buffer.moveStr(1, view(option.label), attr);
            if (!option.detail.empty())
            {
                TColorAttr detailAttr = attr;
                if (index != selected)
                    setFore(detailAttr, TColorDesired(TColorBIOS(0x8)));
                const int detailWidth = static_cast<int>(TText::width(view(option.detail)));
                buffer.moveStr(static_cast<ushort>(std::max(1, width - detailWidth - 1)), view(option.detail), detailAttr);
            }
            writeLine(left, top + row, width, 1, buffer);
        }
    }

    void LivePreviewEditor::draw()
    {
        controller.refreshIfStale();

        const TAttrPair colors = getColor(0x0201);
        rowMaps.assign(static_cast<std::size_t>(std::max(size.y, 0)), RowMap{});
        const std::size_t lines = document.lineCount();
        for (int row = 0; row < size.y; ++row)
        {
            const std::size_t number = static_cast<std::size_t>(delta.y + row);
            if (delta.y + row < 0 || number >= lines)
            {
                TDrawBuffer blank;
                blank.moveChar(0, ' ', colors[0], size.x);
                writeLine(0, row, size.x, 1, blank);
                continue;
            }
            const text::LineInfo line = document.line(number);
            bool decorated = false;
            const std::vector<Cell> cells = layoutLine(line, colors, decorated);
            drawRow(row, cells, line.to, colors[0], decorated);
        }
        drawCompletion();
        setCursor(curPos.x - delta.x, curPos.y - delta.y);
    }

} // namespace lm::edit
