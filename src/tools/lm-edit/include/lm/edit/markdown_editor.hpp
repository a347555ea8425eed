#pragma once

#include "lm/edit/inline_commands.hpp"
#include "lm/edit/markdown_parser.hpp"
#include "lm/find/buffer_search.hpp"
#include "lm/preview/preview_controller.hpp"
#include "lm/settings.hpp"
#include "lm/text/editor_host.hpp"

#define Uses_TWindow
#define Uses_TFrame
#define Uses_TScrollBar
#define Uses_TIndicator
#define Uses_TView
#define Uses_TFileEditor
#define Uses_TRect
#define Uses_TMenu
#define Uses_TEvent
#define Uses_TPoint
#define Uses_TDrawBuffer
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TSubMenu
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_TFileDialog
#define Uses_TChDirDialog
#define Uses_TCommandSet
#define Uses_TApplication
#define Uses_MsgBox
#define Uses_TKeys
#define Uses_TProgram
#define Uses_TDialog
#define Uses_TObject
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_TCheckBoxes
#define Uses_TSItem
#define Uses_TButton
#define Uses_TListViewer
#define Uses_TStaticText
#include <tvision/tv.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lm::edit
{

inline constexpr std::string_view kAppId = "lm-edit";
inline constexpr std::string_view kAppShortDescription = "Markdown notes editor with live preview and wiki links";

class MarkdownEditWindow;
class MarkdownEditorApp;

inline constexpr ushort cmBold = 3000;
inline constexpr ushort cmItalic = 3001;
inline constexpr ushort cmInlineCode = 3002;
inline constexpr ushort cmInsertLink = 3003;
inline constexpr ushort cmActivate = 3010;
inline constexpr ushort cmToggleLivePreview = 3020;
inline constexpr ushort cmToggleWikiLinks = 3021;
inline constexpr ushort cmListLinks = 3022;
inline constexpr ushort cmRefreshNotes = 3023;
inline constexpr ushort cmShowFindBar = 3030;
inline constexpr ushort cmFindNext = 3031;
inline constexpr ushort cmFindPrev = 3032;
inline constexpr ushort cmReplaceOne = 3033;
inline constexpr ushort cmReplaceAll = 3034;
inline constexpr ushort cmSaveSettings = 3040;
inline constexpr ushort cmAbout = 3090;

// TFileEditor that keeps a mirror of its gap buffer so the live preview
// core can read and edit it through the EditorHost contract.
class LivePreviewEditor : public TFileEditor, public text::EditorHost
{
public:
    LivePreviewEditor(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll,
                      TIndicator *indicator, TStringView fileName) noexcept;

    const text::TextSource &text() const override { return document; }
    std::size_t caret() const override { return curPtr; }
    text::TextRange viewport() const override;
    bool dispatch(const text::EditTransaction &transaction) override;
    void setSelection(std::size_t anchor, std::size_t head) override;
    void scrollIntoView(std::size_t pos) override;

    void setHostWindow(MarkdownEditWindow *window) noexcept { hostWindow = window; }
    preview::PreviewController &preview() noexcept { return controller; }
    find::BufferSearch &search() noexcept { return bufferSearch; }
    const text::TextDocument &mirror() const noexcept { return document; }

    void applySettings(const preview::PreviewSettings &settings);
    void applyInline(InlineCommand command);
    preview::ActivationResult activateAtCaret();
    std::vector<std::string> outgoingLinks() const;

    bool completionVisible() const noexcept { return completion.has_value(); }
    void closeCompletion();

    // The find bar highlights every match while it is open.
    void setSearchHighlight(bool enabled);

    virtual void handleEvent(TEvent &event) override;
    virtual void draw() override;

private:
    struct Cell
    {
        std::string glyph;
        int width = 1;
        TColorAttr attr;
        std::size_t offset = 0;
    };

    struct RowMap
    {
        bool decorated = false;
        std::vector<std::size_t> offsets;
    };

    struct BufferSnapshot
    {
        uint insCount = 0;
        uint delCount = 0;
        uint bufLen = 0;
        uint curPtr = 0;
        Boolean modified = False;
        TPoint delta {0, 0};
    };

    class GapBuffer;

    BufferSnapshot snapshot() const noexcept;
    void syncDocument();
    void afterBufferEvent(const BufferSnapshot &before);
    void refreshCompletion();
    bool handleCompletionKey(TEvent &event);
    bool handlePreviewClick(TEvent &event);
    std::optional<std::size_t> offsetAt(TPoint local) const;

    std::vector<Cell> layoutLine(const text::LineInfo &line, TAttrPair colors, bool &decorated) const;
    void drawRow(int row, const std::vector<Cell> &cells, std::size_t lineEnd, TColorAttr blank, bool decorated);
    void drawCompletion();

    MarkdownEditWindow *hostWindow = nullptr;
    text::TextDocument document;
    MarkdownTreeProvider treeProvider;
    preview::PreviewController controller;
    find::BufferSearch bufferSearch;
    std::optional<wiki::CompletionResult> completion;
    std::size_t completionIndex = 0;
    std::optional<std::size_t> dismissedCompletionAt;
    bool highlightMatches = false;
    std::vector<RowMap> rowMaps;
};

class MarkdownEditWindow : public TWindow
{
public:
    MarkdownEditWindow(const TRect &bounds, TStringView fileName, int aNumber) noexcept;

    LivePreviewEditor *editor() noexcept { return fileEditor; }
    void updateWindowTitle();
    bool saveDocument(bool forceSaveAs);

    virtual void handleEvent(TEvent &event) override;
    virtual void setState(ushort aState, Boolean enable) override;
    virtual void shutDown() override;

private:
    LivePreviewEditor *fileEditor = nullptr;
    TScrollBar *hScrollBar = nullptr;
    TScrollBar *vScrollBar = nullptr;
    TIndicator *indicator = nullptr;

    void applyWindowTitle(const std::string &titleText);
};

class SearchStatusView;

// Modeless find/replace bar. Typing only records the query; the
// application applies it once input has paused.
class FindBar : public TDialog
{
public:
    FindBar(const TRect &bounds, bool caseSensitive) noexcept;

    std::string query() const;
    std::string replacement() const;
    bool caseSensitive() const;
    void setStatus(const std::string &text);

    virtual void handleEvent(TEvent &event) override;
    virtual void shutDown() override;

private:
    TInputLine *queryInput = nullptr;
    TInputLine *replaceInput = nullptr;
    TCheckBoxes *caseBox = nullptr;
    SearchStatusView *statusView = nullptr;
};

class MarkdownEditorApp : public TApplication
{
public:
    MarkdownEditorApp(std::shared_ptr<config::SettingsStore> store, const std::vector<std::string> &files);

    static TMenuBar *initMenuBar(TRect);
    static TStatusLine *initStatusLine(TRect);

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

    void showTemporaryMessage(const std::string &message);
    void showDocumentSavedMessage(const std::string &path);
    void followWikiLink(const std::string &title);
    void refreshTitleIndex();

    void editorActivated(MarkdownEditWindow *window) noexcept;
    void editorWindowClosing(MarkdownEditWindow *window);
    void findBarClosing(FindBar *bar);

private:
    MarkdownEditWindow *openEditor(const char *fileName, Boolean visible);
    MarkdownEditWindow *findOpenEditor(const std::filesystem::path &path);
    MarkdownEditWindow *currentEditorWindow();
    LivePreviewEditor *currentEditor();
    void attachEditor(LivePreviewEditor &editor);
    void fileOpen();
    void fileNew();
    void changeDir();
    void showAbout();
    void dispatchToEditor(ushort command);
    void togglePreviewSetting(ushort command);
    void applySettingsToEditors();
    void listOutgoingLinks();
    void saveSettings();
    void clearStatusMessage();

    void showFindBar();
    void runSearchCommand(ushort command);
    void applyPendingQuery(LivePreviewEditor &editor);
    void pollFindBar();
    void updateFindStatus();

    std::shared_ptr<config::SettingsStore> settingsStore;
    preview::PreviewSettings settings;
    wiki::NoteTitleIndex titleIndex;

    MarkdownEditWindow *lastEditorWindow = nullptr;
    FindBar *findBar = nullptr;
    std::string pendingQuery;
    bool pendingCaseSensitive = false;
    std::chrono::steady_clock::time_point pendingSince{};
    bool queryPending = false;

    std::atomic<uint32_t> statusMessageCounter = 0;
    std::atomic<uint32_t> activeStatusMessageToken = 0;
    std::atomic<uint32_t> pendingStatusMessageClear = 0;
};

} // namespace lm::edit
