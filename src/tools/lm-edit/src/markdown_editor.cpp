#include "lm/edit/markdown_editor.hpp"

#include "lm/edit/editor_options.hpp"
#include "lm/edit/note_directory.hpp"

#define Uses_TScrollBar
#define Uses_TListViewer
#include <tvision/tv.h>

#include <algorithm>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>
#include <vector>

#ifndef LM_EDIT_VERSION
#define LM_EDIT_VERSION "0.0.0"
#endif

namespace lm::edit
{
    namespace
    {
        constexpr int kMaxQueryLength = 256;
        constexpr auto kSearchDebounce = std::chrono::milliseconds(150);

        ushort execDialog(TDialog *d, void *data = nullptr);

        ushort runEditorDialog(int dialog, ...)
        {
            va_list args;
            switch (dialog)
            {
            case edOutOfMemory:
                return messageBox("Not enough memory for this operation.", mfError | mfOKButton);
            case edReadError:
            case edWriteError:
            case edCreateError:
            {
                va_start(args, dialog);
                const char *file = va_arg(args, const char *);
                va_end(args);
                std::ostringstream text;
                switch (dialog)
                {
                case edReadError:
                    text << "Error reading file ";
                    break;
                case edWriteError:
                    text << "Error writing file ";
                    break;
                default:
                    text << "Error creating file ";
                    break;
                }
                if (file && *file)
                    text << file;
                text << '.';
                return messageBox(text.str().c_str(), mfError | mfOKButton);
            }
            case edSaveModify:
            {
                va_start(args, dialog);
                const char *file = va_arg(args, const char *);
                va_end(args);
                std::ostringstream text;
                if (file && *file)
                    text << file << " has been modified. Save?";
                else
                    text << "Note has been modified. Save?";
                return messageBox(text.str().c_str(), mfConfirmation | mfYesNoCancel);
            }
            case edSaveUntitled:
                return messageBox("Save untitled note?", mfConfirmation | mfYesNoCancel);
            case edSaveAs:
            {
                va_start(args, dialog);
                char *file = va_arg(args, char *);
                va_end(args);
                return execDialog(new TFileDialog("*.md", "Save note as", "~N~ame", fdOKButton, 101), file);
            }
            default:
                return cmCancel;
            }
        }

        void delay(unsigned milliseconds)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
        }

        ushort execDialog(TDialog *d, void *data)
        {
            TView *p = TProgram::application->validView(d);
            if (!p)
                return cmCancel;
            if (data)
                p->setData(data);
            ushort result = TProgram::deskTop->execView(p);
            if (result != cmCancel && data)
                p->getData(data);
            TObject::destroy(p);
            return result;
        }

        class MarkdownStatusLine : public TStatusLine
        {
        public:
            MarkdownStatusLine(TRect r)
                : TStatusLine(r, *new TStatusDef(0, 0xFFFF) +
                                     *new TStatusItem("~F2~ Save", kbF2, cmSave) +
                                     *new TStatusItem("~Ctrl-F~ Find", kbCtrlF, cmShowFindBar) +
                                     *new TStatusItem("~Ctrl-Enter~ Follow", kbNoKey, cmActivate) +
                                     *new TStatusItem("~F8~ Preview", kbF8, cmToggleLivePreview) +
                                     *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit) +
                                     *new TStatusItem(nullptr, kbF10, cmMenu) +
                                     *new TStatusItem(nullptr, kbAltF3, cmClose) +
                                     *new TStatusItem(nullptr, kbF5, cmZoom) +
                                     *new TStatusItem(nullptr, kbF6, cmNext))
            {
            }

            void showTemporaryMessage(const std::string &message)
            {
                temporaryMessage = message;
                showingTemporaryMessage = true;
                drawView();
            }

            void clearTemporaryMessage()
            {
                if (!showingTemporaryMessage)
                    return;
                showingTemporaryMessage = false;
                temporaryMessage.clear();
                drawView();
            }

            const char *hint(ushort helpCtx) override
            {
                if (showingTemporaryMessage)
                    return temporaryMessage.c_str();
                return TStatusLine::hint(helpCtx);
            }

        private:
            std::string temporaryMessage;
            bool showingTemporaryMessage = false;
        };

        class LinkListViewer : public TListViewer
        {
        public:
            LinkListViewer(const TRect &bounds, TScrollBar *vScroll, std::vector<std::string> items)
                : TListViewer(bounds, 1, nullptr, vScroll),
                  links(std::move(items))
            {
                setRange(static_cast<short>(links.size()));
            }

            void getText(char *dest, short item, short maxLen) override
            {
                if (item < 0 || static_cast<std::size_t>(item) >= links.size() || maxLen <= 0)
                {
                    *dest = '\0';
                    return;
                }
                std::strncpy(dest, links[static_cast<std::size_t>(item)].c_str(), static_cast<std::size_t>(maxLen));
                dest[maxLen - 1] = '\0';
            }

        private:
            std::vector<std::string> links;
        };

        class LinksDialog : public TDialog
        {
        public:
            LinksDialog(const TRect &bounds, const char *title)
                : TWindowInit(&TDialog::initFrame),
                  TDialog(bounds, title)
            {
            }

            void handleEvent(TEvent &event) override
            {
                TDialog::handleEvent(event);
                if (event.what == evBroadcast && event.message.command == cmListItemSelected)
                {
                    endModal(cmOK);
                    clearEvent(event);
                }
            }
        };

        constexpr const char *kLivePreviewLabel = "Live ~P~review";
        constexpr const char *kWikiLinksLabel = "~W~iki Links";
        TMenuItem *gLivePreviewItem = nullptr;
        TMenuItem *gWikiLinksItem = nullptr;

        void updateToggleLabel(TMenuItem *item, const char *baseLabel, bool enabled)
        {
            if (!item)
                return;
            std::string label = std::string(enabled ? "[x] " : "[ ] ") + baseLabel;
            delete[] const_cast<char *>(item->name);
            item->name = newStr(label.c_str());
        }

        TSubMenu &makeFileMenu()
        {
            return *new TSubMenu("~F~ile", kbNoKey) +
                   *new TMenuItem("~O~pen...", cmOpen, kbNoKey, hcNoContext) +
                   *new TMenuItem("~N~ew", cmNew, kbNoKey, hcNoContext) +
                   *new TMenuItem("~S~ave", cmSave, kbF2, hcNoContext, "F2") +
                   *new TMenuItem("S~a~ve as...", cmSaveAs, kbNoKey) +
                   *new TMenuItem("~C~lose", cmClose, kbAltF3, hcNoContext, "Alt-F3") +
                   newLine() +
                   *new TMenuItem("~C~hange dir...", cmChangeDir, kbNoKey) +
                   *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");
        }

        TSubMenu &makeEditMenu()
        {
            return *new TSubMenu("~E~dit", kbNoKey) +
                   *new TMenuItem("~U~ndo", cmUndo, kbNoKey, hcNoContext) +
                   newLine() +
                   *new TMenuItem("Cu~t~", cmCut, kbNoKey, hcNoContext) +
                   *new TMenuItem("~C~opy", cmCopy, kbNoKey, hcNoContext) +
                   *new TMenuItem("~P~aste", cmPaste, kbNoKey, hcNoContext);
        }

        TSubMenu &makeSearchMenu()
        {
            return *new TSubMenu("~S~earch", kbNoKey) +
                   *new TMenuItem("~F~ind / Replace...", cmShowFindBar, kbCtrlF, hcNoContext, "Ctrl-F") +
                   *new TMenuItem("Find ~N~ext", cmFindNext, kbCtrlL, hcNoContext, "Ctrl-L") +
                   *new TMenuItem("Find ~P~revious", cmFindPrev, kbNoKey, hcNoContext) +
                   newLine() +
                   *new TMenuItem("~R~eplace", cmReplaceOne, kbNoKey, hcNoContext) +
                   *new TMenuItem("Replace ~A~ll", cmReplaceAll, kbNoKey, hcNoContext);
        }

        TSubMenu &makeFormatMenu()
        {
            return *new TSubMenu("For~m~at", kbNoKey) +
                   *new TMenuItem("~B~old", cmBold, kbCtrlB, hcNoContext, "Ctrl-B") +
                   *new TMenuItem("~I~talic", cmItalic, kbAltI, hcNoContext, "Alt-I") +
                   *new TMenuItem("Inline ~C~ode", cmInlineCode, kbAltC, hcNoContext, "Alt-C") +
                   *new TMenuItem("~L~ink", cmInsertLink, kbAltK, hcNoContext, "Alt-K");
        }

        TSubMenu &makeNotesMenu()
        {
            return *new TSubMenu("~N~otes", kbNoKey) +
                   *new TMenuItem("~F~ollow Link / Toggle Task", cmActivate, kbNoKey, hcNoContext, "Ctrl-Enter") +
                   *new TMenuItem("Outgoing ~L~inks...", cmListLinks, kbF4, hcNoContext, "F4") +
                   *new TMenuItem("~R~escan Notes", cmRefreshNotes, kbNoKey, hcNoContext);
        }

        TSubMenu &makeViewMenu()
        {
            gLivePreviewItem = new TMenuItem(kLivePreviewLabel, cmToggleLivePreview, kbF8, hcNoContext, "F8");
            gWikiLinksItem = new TMenuItem(kWikiLinksLabel, cmToggleWikiLinks, kbShiftF8, hcNoContext, "Shift-F8");
            return *new TSubMenu("~V~iew", kbNoKey) +
                   *gLivePreviewItem +
                   *gWikiLinksItem +
                   newLine() +
                   *new TMenuItem("~S~ave Settings", cmSaveSettings, kbNoKey, hcNoContext);
        }

        TSubMenu &makeWindowMenu()
        {
            return *new TSubMenu("~W~indows", kbNoKey) +
                   *new TMenuItem("~R~esize/Move", cmResize, kbNoKey, hcNoContext) +
                   *new TMenuItem("~Z~oom", cmZoom, kbF5, hcNoContext, "F5") +
                   *new TMenuItem("~N~ext", cmNext, kbF6, hcNoContext, "F6") +
                   *new TMenuItem("~C~lose", cmClose, kbNoKey, hcNoContext) +
                   *new TMenuItem("~T~ile", cmTile, kbNoKey) +
                   *new TMenuItem("C~a~scade", cmCascade, kbNoKey);
        }

        TSubMenu &makeHelpMenu()
        {
            return *new TSubMenu("~H~elp", kbNoKey) +
                   *new TMenuItem("~A~bout", cmAbout, kbNoKey, hcNoContext);
        }

        MarkdownStatusLine *markdownStatusLine()
        {
            return dynamic_cast<MarkdownStatusLine *>(TProgram::statusLine);
        }

        void applySettingsTo(TView *view, void *arg)
        {
            auto *window = dynamic_cast<MarkdownEditWindow *>(view);
            if (!window || !window->editor())
                return;
            window->editor()->applySettings(*static_cast<const preview::PreviewSettings *>(arg));
        }

        void applyTitleIndexTo(TView *view, void *arg)
        {
            auto *window = dynamic_cast<MarkdownEditWindow *>(view);
            if (!window || !window->editor())
                return;
            window->editor()->preview().setTitleIndex(*static_cast<const wiki::NoteTitleIndex *>(arg));
        }

        Boolean editorHasPath(TView *view, void *arg)
        {
            auto *window = dynamic_cast<MarkdownEditWindow *>(view);
            if (!window || !window->editor() || window->editor()->fileName[0] == '\0')
                return False;
            std::error_code ec;
            const auto *wanted = static_cast<const std::filesystem::path *>(arg);
            return Boolean(std::filesystem::equivalent(std::filesystem::path(window->editor()->fileName), *wanted, ec));
        }

        Boolean windowIsTileable(TView *view, void *)
        {
            return Boolean((view->options & ofTileable) != 0);
        }

    } // namespace

    MarkdownEditWindow::MarkdownEditWindow(const TRect &bounds, TStringView fileName, int aNumber) noexcept
        : TWindowInit(&TWindow::initFrame), TWindow(bounds, nullptr, aNumber)
    {
        options |= ofTileable;

        indicator = new TIndicator(TRect(2, size.y - 1, 16, size.y));
        insert(indicator);

        hScrollBar = new TScrollBar(TRect(18, size.y - 1, size.x - 2, size.y));
        insert(hScrollBar);

        vScrollBar = new TScrollBar(TRect(size.x - 1, 1, size.x, size.y - 1));
        insert(vScrollBar);

        fileEditor = new LivePreviewEditor(TRect(1, 1, size.x - 1, size.y - 1), hScrollBar, vScrollBar, indicator,
                                           fileName);
        insert(fileEditor);
        fileEditor->setHostWindow(this);
        updateWindowTitle();
    }

    void MarkdownEditWindow::applyWindowTitle(const std::string &titleText)
    {
        if (title)
        {
            delete[] const_cast<char *>(title);
            title = nullptr;
        }
        title = newStr(titleText.c_str());
        if (frame)
            frame->drawView();
    }

    void MarkdownEditWindow::updateWindowTitle()
    {
        if (!fileEditor)
            return;

        std::string displayName;
        if (fileEditor->fileName[0] != '\0')
        {
            std::filesystem::path path(fileEditor->fileName);
            displayName = path.filename().string();
            if (displayName.empty())
                displayName = path.string();
        }
        else
        {
            displayName = "Untitled";
        }

        applyWindowTitle(displayName);
    }

    bool MarkdownEditWindow::saveDocument(bool forceSaveAs)
    {
        if (!fileEditor)
            return false;

        bool saved = forceSaveAs ? static_cast<bool>(fileEditor->saveAs())
                                 : static_cast<bool>(fileEditor->save());
        if (!saved)
            return false;

        updateWindowTitle();

        std::string newName = fileEditor->fileName;
        std::string savedPath = newName.empty() ? std::string("Untitled") : newName;

        if (auto *app = dynamic_cast<MarkdownEditorApp *>(TProgram::application))
        {
            app->showDocumentSavedMessage(savedPath);
            app->refreshTitleIndex();
        }
        return true;
    }

    void MarkdownEditWindow::handleEvent(TEvent &event)
    {
        TWindow::handleEvent(event);
        if (event.what == evBroadcast && event.message.command == cmUpdateTitle)
        {
            updateWindowTitle();
            clearEvent(event);
        }
    }

    void MarkdownEditWindow::setState(ushort aState, Boolean enable)
    {
        TWindow::setState(aState, enable);
        if ((aState & sfActive) != 0 && enable)
        {
            if (auto *app = dynamic_cast<MarkdownEditorApp *>(TProgram::application))
                app->editorActivated(this);
        }
    }

    void MarkdownEditWindow::shutDown()
    {
        if (auto *app = dynamic_cast<MarkdownEditorApp *>(TProgram::application))
            app->editorWindowClosing(this);
        fileEditor = nullptr;
        TWindow::shutDown();
    }

    class SearchStatusView : public TStaticText
    {
    public:
        explicit SearchStatusView(const TRect &bounds)
            : TStaticText(bounds, "")
        {
        }

        void setText(const std::string &value)
        {
            if (value == (text ? text : ""))
                return;
            delete[] const_cast<char *>(text);
            text = newStr(value.c_str());
            drawView();
        }
    };

    FindBar::FindBar(const TRect &bounds, bool caseSensitive) noexcept
        : TWindowInit(&TDialog::initFrame), TDialog(bounds, "Find / Replace")
    {
        queryInput = new TInputLine(TRect(13, 2, size.x - 3, 3), kMaxQueryLength);
        insert(queryInput);
        insert(new TLabel(TRect(2, 2, 12, 3), "~F~ind", queryInput));

        replaceInput = new TInputLine(TRect(13, 4, size.x - 3, 5), kMaxQueryLength);
        insert(replaceInput);
        insert(new TLabel(TRect(2, 4, 12, 5), "~R~eplace", replaceInput));

        caseBox = new TCheckBoxes(TRect(3, 6, 25, 7), new TSItem("~C~ase sensitive", nullptr));
        insert(caseBox);
        ushort caseMask = caseSensitive ? 1 : 0;
        caseBox->setData(&caseMask);

        statusView = new SearchStatusView(TRect(27, 6, size.x - 3, 7));
        insert(statusView);

        insert(new TButton(TRect(2, 8, 13, 10), "~N~ext", cmFindNext, bfDefault));
        insert(new TButton(TRect(14, 8, 25, 10), "~P~rev", cmFindPrev, bfNormal));
        insert(new TButton(TRect(26, 8, 39, 10), "Repl~a~ce", cmReplaceOne, bfNormal));
        insert(new TButton(TRect(40, 8, 53, 10), "Rep~l~ace all", cmReplaceAll, bfNormal));

        queryInput->select();
    }

    std::string FindBar::query() const
    {
        return queryInput && queryInput->data ? std::string(queryInput->data) : std::string();
    }

    std::string FindBar::replacement() const
    {
        return replaceInput && replaceInput->data ? std::string(replaceInput->data) : std::string();
    }

    bool FindBar::caseSensitive() const
    {
        return caseBox && caseBox->mark(0);
    }

    void FindBar::setStatus(const std::string &text)
    {
        if (statusView)
            statusView->setText(text);
    }

    void FindBar::handleEvent(TEvent &event)
    {
        TDialog::handleEvent(event);
        if (event.what == evCommand && event.message.command == cmCancel && (state & sfModal) == 0)
        {
            close();
            clearEvent(event);
        }
    }

    void FindBar::shutDown()
    {
        if (auto *app = dynamic_cast<MarkdownEditorApp *>(TProgram::application))
            app->findBarClosing(this);
        queryInput = nullptr;
        replaceInput = nullptr;
        caseBox = nullptr;
        statusView = nullptr;
        TDialog::shutDown();
    }

    MarkdownEditorApp::MarkdownEditorApp(std::shared_ptr<config::SettingsStore> store,
                                         const std::vector<std::string> &files)
        : TProgInit(&MarkdownEditorApp::initStatusLine, &MarkdownEditorApp::initMenuBar, &TApplication::initDeskTop),
          TApplication(),
          settingsStore(std::move(store))
    {
        TEditor::editorDialog = runEditorDialog;

        settings = loadPreviewSettings(*settingsStore);
        pendingCaseSensitive = caseSensitiveSearch(*settingsStore);
        updateToggleLabel(gLivePreviewItem, kLivePreviewLabel, settings.livePreview);
        updateToggleLabel(gWikiLinksItem, kWikiLinksLabel, settings.wikiLinks);
        refreshTitleIndex();

        TCommandSet ts;
        ts.enableCmd(cmSave);
        ts.enableCmd(cmSaveAs);
        ts.enableCmd(cmCut);
        ts.enableCmd(cmCopy);
        ts.enableCmd(cmPaste);
        ts.enableCmd(cmClear);
        ts.enableCmd(cmUndo);
        disableCommands(ts);

        for (const auto &file : files)
            openEditor(file.c_str(), True);
        cascade();
    }

    MarkdownEditWindow *MarkdownEditorApp::openEditor(const char *fileName, Boolean visible)
    {
        TRect r = deskTop->getExtent();
        auto *win = (MarkdownEditWindow *)validView(new MarkdownEditWindow(r, fileName, wnNoNumber));
        if (!win)
            return nullptr;
        attachEditor(*win->editor());
        if (!visible)
            win->hide();
        deskTop->insert(win);
        return win;
    }

    MarkdownEditWindow *MarkdownEditorApp::findOpenEditor(const std::filesystem::path &path)
    {
        if (!deskTop)
            return nullptr;
        std::filesystem::path wanted = path;
        return dynamic_cast<MarkdownEditWindow *>(deskTop->firstThat(editorHasPath, &wanted));
    }

    MarkdownEditWindow *MarkdownEditorApp::currentEditorWindow()
    {
        if (deskTop)
        {
            if (auto *win = dynamic_cast<MarkdownEditWindow *>(deskTop->current))
                return win;
        }
        return lastEditorWindow;
    }

    LivePreviewEditor *MarkdownEditorApp::currentEditor()
    {
        auto *win = currentEditorWindow();
        return win ? win->editor() : nullptr;
    }

    void MarkdownEditorApp::attachEditor(LivePreviewEditor &editor)
    {
        editor.preview().setNavigateCallback([this](const std::string &title) { followWikiLink(title); });
        editor.preview().setTitleIndex(titleIndex);
        editor.applySettings(settings);
    }

    void MarkdownEditorApp::fileOpen()
    {
        char name[MAXPATH] = "*.md";
        if (execDialog(new TFileDialog("*.md", "Open note", "~N~ame", fdOpenButton, 100), name) != cmCancel)
            openEditor(name, True);
    }

    void MarkdownEditorApp::fileNew()
    {
        openEditor(nullptr, True);
    }

    void MarkdownEditorApp::changeDir()
    {
        execDialog(new TChDirDialog(cdNormal, 0), nullptr);
        refreshTitleIndex();
    }

    void MarkdownEditorApp::showAbout()
    {
        std::string text = "\003" + std::string(kAppId) + " " LM_EDIT_VERSION "\n\n\003" +
                           std::string(kAppShortDescription);
        messageBox(text.c_str(), mfInformation | mfOKButton);
    }

    void MarkdownEditorApp::dispatchToEditor(ushort command)
    {
        auto *editor = currentEditor();
        if (!editor)
            return;
        TEvent ev;
        ev.what = evCommand;
        ev.message.command = command;
        ev.message.infoPtr = nullptr;
        editor->handleEvent(ev);
    }

    void MarkdownEditorApp::followWikiLink(const std::string &title)
    {
        NoteDirectory notes(notesDirectory(*settingsStore));
        auto path = notes.findOrCreate(title);
        if (!path)
        {
            showTemporaryMessage("Could not open note \"" + title + "\" in " + notes.root().string());
            return;
        }

        if (auto *existing = findOpenEditor(*path))
        {
            existing->select();
            return;
        }

        const std::string fileName = path->string();
        if (!openEditor(fileName.c_str(), True))
        {
            showTemporaryMessage("Could not open " + fileName);
            return;
        }
        refreshTitleIndex();
        showTemporaryMessage("Opened note: " + title);
    }

    void MarkdownEditorApp::refreshTitleIndex()
    {
        NoteDirectory notes(notesDirectory(*settingsStore));
        titleIndex = notes.titleIndex();
        if (deskTop)
            deskTop->forEach(applyTitleIndexTo, &titleIndex);
    }

    void MarkdownEditorApp::togglePreviewSetting(ushort command)
    {
        if (command == cmToggleLivePreview)
        {
            settings.livePreview = !settings.livePreview;
            showTemporaryMessage(settings.livePreview ? "Live preview on" : "Live preview off");
        }
        else
        {
            settings.wikiLinks = !settings.wikiLinks;
            showTemporaryMessage(settings.wikiLinks ? "Wiki links on" : "Wiki links off");
        }
        updateToggleLabel(gLivePreviewItem, kLivePreviewLabel, settings.livePreview);
        updateToggleLabel(gWikiLinksItem, kWikiLinksLabel, settings.wikiLinks);
        applySettingsToEditors();
    }

    void MarkdownEditorApp::applySettingsToEditors()
    {
        if (deskTop)
            deskTop->forEach(applySettingsTo, &settings);
    }

    void MarkdownEditorApp::listOutgoingLinks()
    {
        auto *editor = currentEditor();
        if (!editor)
            return;
        std::vector<std::string> links = editor->outgoingLinks();
        if (links.empty())
        {
            showTemporaryMessage("No wiki links in this note");
            return;
        }

        auto *dialog = new LinksDialog(TRect(0, 0, 52, 17), "Outgoing Links");
        dialog->options |= ofCentered;
        auto *scrollBar = new TScrollBar(TRect(48, 2, 49, 13));
        dialog->insert(scrollBar);
        auto *viewer = new LinkListViewer(TRect(3, 2, 48, 13), scrollBar, links);
        dialog->insert(viewer);
        dialog->insert(new TButton(TRect(26, 14, 36, 16), "~O~pen", cmOK, bfDefault));
        dialog->insert(new TButton(TRect(38, 14, 48, 16), "Cancel", cmCancel, bfNormal));
        dialog->selectNext(False);

        TView *p = validView(dialog);
        if (!p)
            return;
        ushort result = deskTop->execView(p);
        const short chosen = viewer->focused;
        TObject::destroy(p);

        if (result == cmOK && chosen >= 0 && static_cast<std::size_t>(chosen) < links.size())
            followWikiLink(links[static_cast<std::size_t>(chosen)]);
    }

    void MarkdownEditorApp::saveSettings()
    {
        storePreviewSettings(*settingsStore, settings);
        const bool matchCase = findBar ? findBar->caseSensitive() : pendingCaseSensitive;
        settingsStore->assign(kSettingCaseSensitiveSearch, matchCase);

        std::filesystem::path dest = settingsStore->userSettingsPath();
        if (settingsStore->writeUserSettings())
        {
            showTemporaryMessage("Settings saved to " + dest.string());
        }
        else
        {
            std::string message = "Failed to save settings:\n" + dest.string();
            messageBox(message.c_str(), mfError | mfOKButton);
        }
    }

    void MarkdownEditorApp::showFindBar()
    {
        if (findBar)
        {
            findBar->select();
            return;
        }

        TRect extent = deskTop->getExtent();
        TRect bounds(0, 0, 58, 11);
        bounds.move(std::max(0, extent.b.x - bounds.b.x), std::max(0, extent.b.y - bounds.b.y));
        auto *bar = new FindBar(bounds, pendingCaseSensitive);
        if (!validView(bar))
            return;
        findBar = bar;
        pendingQuery.clear();
        queryPending = false;
        deskTop->insert(findBar);
        if (auto *editor = currentEditor())
        {
            editor->setSearchHighlight(true);
            if (!editor->search().query().empty())
                findBar->setStatus(find::describeSearchState(editor->search().state()));
        }
    }

    void MarkdownEditorApp::applyPendingQuery(LivePreviewEditor &editor)
    {
        queryPending = false;
        find::BufferSearch &search = editor.search();
        if (search.query() == pendingQuery && search.caseSensitive() == pendingCaseSensitive)
            return;
        search.setQuery(pendingQuery, pendingCaseSensitive);
        editor.setSearchHighlight(findBar != nullptr && !pendingQuery.empty());
        editor.drawView();
    }

    void MarkdownEditorApp::runSearchCommand(ushort command)
    {
        auto *editor = currentEditor();
        if (!editor)
        {
            showTemporaryMessage("No note to search");
            return;
        }
        if (findBar)
        {
            pendingQuery = findBar->query();
            pendingCaseSensitive = findBar->caseSensitive();
            applyPendingQuery(*editor);
        }

        find::BufferSearch &search = editor->search();
        search.refresh();
        if (search.phase() == find::SearchPhase::Idle)
        {
            showTemporaryMessage("Nothing to search for");
            return;
        }

        switch (command)
        {
        case cmFindNext:
            if (!search.next())
                showTemporaryMessage("No results");
            break;
        case cmFindPrev:
            if (!search.prev())
                showTemporaryMessage("No results");
            break;
        case cmReplaceOne:
            if (!search.replaceCurrent(findBar ? findBar->replacement() : std::string()))
                showTemporaryMessage("Select a match first");
            break;
        case cmReplaceAll:
        {
            const std::size_t replaced = search.replaceAll(findBar ? findBar->replacement() : std::string());
            showTemporaryMessage("Replaced " + std::to_string(replaced) + " occurrence" + (replaced == 1 ? "" : "s"));
            break;
        }
        default:
            break;
        }
        editor->drawView();
        updateFindStatus();
    }

    // Typing in the find bar only restarts the debounce clock; the scan
    // runs once the query has been stable for kSearchDebounce.
    void MarkdownEditorApp::pollFindBar()
    {
        if (!findBar)
            return;

        const std::string query = findBar->query();
        const bool matchCase = findBar->caseSensitive();
        const auto now = std::chrono::steady_clock::now();
        if (query != pendingQuery || matchCase != pendingCaseSensitive)
        {
            pendingQuery = query;
            pendingCaseSensitive = matchCase;
            pendingSince = now;
            queryPending = true;
            return;
        }

        auto *editor = currentEditor();
        if (!editor)
            return;
        if (!queryPending || now - pendingSince >= kSearchDebounce)
            applyPendingQuery(*editor);
        editor->search().refresh();
        updateFindStatus();
    }

    void MarkdownEditorApp::updateFindStatus()
    {
        if (!findBar)
            return;
        auto *editor = currentEditor();
        if (!editor || editor->search().phase() == find::SearchPhase::Idle)
        {
            findBar->setStatus("");
            return;
        }
        findBar->setStatus(find::describeSearchState(editor->search().state()));
    }

    void MarkdownEditorApp::editorActivated(MarkdownEditWindow *window) noexcept
    {
        lastEditorWindow = window;
    }

    void MarkdownEditorApp::editorWindowClosing(MarkdownEditWindow *window)
    {
        if (lastEditorWindow == window)
            lastEditorWindow = nullptr;
        updateFindStatus();
    }

    void MarkdownEditorApp::findBarClosing(FindBar *bar)
    {
        if (findBar != bar)
            return;
        pendingCaseSensitive = bar->caseSensitive();
        findBar = nullptr;
        queryPending = false;
        if (lastEditorWindow && lastEditorWindow->editor())
        {
            LivePreviewEditor *editor = lastEditorWindow->editor();
            editor->search().close();
            editor->setSearchHighlight(false);
        }
    }

    void MarkdownEditorApp::showTemporaryMessage(const std::string &message)
    {
        auto *line = markdownStatusLine();
        if (!line)
            return;

        line->showTemporaryMessage(message);

        const uint32_t token = statusMessageCounter.fetch_add(1, std::memory_order_relaxed) + 1;
        activeStatusMessageToken.store(token, std::memory_order_release);
        pendingStatusMessageClear.store(0, std::memory_order_release);

        std::thread([this, token]()
                    {
        delay(3000);
        pendingStatusMessageClear.store(token, std::memory_order_release); }).detach();
    }

    void MarkdownEditorApp::showDocumentSavedMessage(const std::string &path)
    {
        showTemporaryMessage("Note saved: " + path);
    }

    void MarkdownEditorApp::clearStatusMessage()
    {
        if (auto *line = markdownStatusLine())
            line->clearTemporaryMessage();
    }

    void MarkdownEditorApp::handleEvent(TEvent &event)
    {
        TApplication::handleEvent(event);
        if (event.what != evCommand)
            return;

        bool handled = true;
        switch (event.message.command)
        {
        case cmOpen:
            fileOpen();
            break;
        case cmNew:
            fileNew();
            break;
        case cmChangeDir:
            changeDir();
            break;
        case cmSave:
        case cmSaveAs:
        case cmBold:
        case cmItalic:
        case cmInlineCode:
        case cmInsertLink:
        case cmActivate:
            dispatchToEditor(event.message.command);
            break;
        case cmToggleLivePreview:
        case cmToggleWikiLinks:
            togglePreviewSetting(event.message.command);
            break;
        case cmListLinks:
            listOutgoingLinks();
            break;
        case cmRefreshNotes:
            refreshTitleIndex();
            showTemporaryMessage(std::to_string(titleIndex.size()) + " notes indexed");
            break;
        case cmShowFindBar:
            showFindBar();
            break;
        case cmFindNext:
        case cmFindPrev:
        case cmReplaceOne:
        case cmReplaceAll:
            runSearchCommand(event.message.command);
            break;
        case cmSaveSettings:
            saveSettings();
            break;
        case cmAbout:
            showAbout();
            break;
        default:
            handled = false;
            break;
        }
        if (handled)
            clearEvent(event);
    }

    void MarkdownEditorApp::idle()
    {
        TApplication::idle();

        if (deskTop && deskTop->firstThat(windowIsTileable, nullptr) != nullptr)
        {
            enableCommand(cmTile);
            enableCommand(cmCascade);
        }
        else
        {
            disableCommand(cmTile);
            disableCommand(cmCascade);
        }

        pollFindBar();

        uint32_t token = pendingStatusMessageClear.load(std::memory_order_acquire);
        if (token == 0)
            return;

        uint32_t active = activeStatusMessageToken.load(std::memory_order_acquire);
        if (token == active)
        {
            clearStatusMessage();
            pendingStatusMessageClear.store(0, std::memory_order_release);
            activeStatusMessageToken.store(0, std::memory_order_release);
        }
        else
        {
            uint32_t expected = token;
            pendingStatusMessageClear.compare_exchange_strong(expected, 0,
                                                              std::memory_order_acq_rel,
                                                              std::memory_order_acquire);
        }
    }

    TMenuBar *MarkdownEditorApp::initMenuBar(TRect r)
    {
        r.b.y = r.a.y + 1;
        return new TMenuBar(r, makeFileMenu() + makeEditMenu() + makeSearchMenu() + makeFormatMenu() +
                                   makeNotesMenu() + makeViewMenu() + makeWindowMenu() + makeHelpMenu());
    }

    TStatusLine *MarkdownEditorApp::initStatusLine(TRect r)
    {
        r.a.y = r.b.y - 1;
        return new MarkdownStatusLine(r);
    }

} // namespace lm::edit
