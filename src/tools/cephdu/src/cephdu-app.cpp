#include "browser_session.hpp"
#include "cephdu_options.hpp"
#include "gauge.hpp"
#include "key_poller.hpp"
#include "popup_scroll.hpp"
#include "usage_format.hpp"

#define Uses_TApplication
#define Uses_TButton
#define Uses_TDeskTop
#define Uses_TDialog
#define Uses_TDrawBuffer
#define Uses_TEvent
#define Uses_TInputLine
#define Uses_TKeys
#define Uses_TLabel
#define Uses_TMenu
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TRect
#define Uses_TScreen
#define Uses_TScrollBar
#define Uses_TStaticText
#define Uses_TStatusDef
#define Uses_TStatusItem
#define Uses_TStatusLine
#define Uses_TSubMenu
#define Uses_TView
#define Uses_TWindow
#define Uses_MsgBox
#include <tvision/tv.h>

#include "cephdu/commands.hpp"
#include "cephdu/logging.hpp"
#include "cephdu/options.hpp"
#include "cephdu/ui/status_line.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <limits.h>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifndef CEPHDU_VERSION
#define CEPHDU_VERSION "0.0.0"
#endif

using namespace cephdu;
namespace config = cephdu::config;
namespace commands = cephdu::commands;

namespace
{

constexpr std::size_t kPollInterval = 64;

std::optional<TEvent> readPendingKey()
{
    TEvent event;
    event.getKeyEvent();
    if (event.what != evKeyDown)
        return std::nullopt;
    return event;
}

bool isCancelKey(const TEvent &event)
{
    return event.keyDown.keyCode == kbCtrlC || event.keyDown.keyCode == kbEsc;
}

const TColorAttr kNormalText{TColorBIOS(0x7), TColorBIOS(0x0)};
const TColorAttr kSelectedText{TColorBIOS(0xF), TColorBIOS(0x8)};
const TColorAttr kErrorMessage{TColorBIOS(0xF), TColorBIOS(0x4)};
const TColorAttr kWarningMessage{TColorBIOS(0x0), TColorBIOS(0xE)};
const TColorAttr kInfoMessage{TColorBIOS(0x7), TColorBIOS(0x0)};

const std::array<std::pair<const char *, const char *>, 18> kKeyHelp = {{
    {"q, Esc", "Quit"},
    {"Down, j", "Move cursor down"},
    {"Up, k", "Move cursor up"},
    {"Page Down", "Jump cursor down"},
    {"Page Up", "Jump cursor up"},
    {"Enter", "Open directory"},
    {"Backspace, h", "Go to parent directory"},
    {"Space", "Go to original directory"},
    {"n", "Sort by name"},
    {"s", "Sort by size"},
    {"c, C", "Sort by file count"},
    {"U", "Sort by owner"},
    {"t", "Sort by change time"},
    {"u", "Toggle show owner"},
    {"?", "Show this help message"},
    {"Home, g", "Select first entry"},
    {"End, G", "Select last entry"},
    {"Ctrl-C", "Interrupt a slow listing"},
}};

std::array<TMenuItem *, 5> gSortMenuItems{};
TMenuItem *gShowOwnerMenuItem = nullptr;

const std::array<std::pair<SortField, const char *>, 5> kSortBaseLabels = {{
    {SortField::Name, "~N~ame"},
    {SortField::Size, "~S~ize"},
    {SortField::RecursiveEntryCount, "~E~ntries"},
    {SortField::Owner, "~O~wner"},
    {SortField::ChangeTime, "Change ~T~ime"},
}};

std::string padLeft(const std::string &text, std::size_t width)
{
    if (text.size() >= width)
        return text;
    return std::string(width - text.size(), ' ') + text;
}

std::string padRight(const std::string &text, std::size_t width)
{
    if (text.size() >= width)
        return text;
    return text + std::string(width - text.size(), ' ');
}

std::string helpText()
{
    std::size_t lhsWidth = 0;
    std::size_t rhsWidth = 0;
    for (const auto &[keys, description] : kKeyHelp)
    {
        lhsWidth = std::max(lhsWidth, std::string(keys).size());
        rhsWidth = std::max(rhsWidth, std::string(description).size());
    }
    std::ostringstream out;
    for (const auto &[keys, description] : kKeyHelp)
        out << padLeft(keys, lhsWidth) << ":  " << padRight(description, rhsWidth) << '\n';
    return out.str();
}

void postCommand(ushort command)
{
    message(TProgram::application, evCommand, command, nullptr);
}

TColorAttr gaugeAttr(GaugeStyle style, bool selected)
{
    TColorAttr base = selected ? kSelectedText : kNormalText;
    if (style == GaugeStyle::InvertedLabel)
        return TColorAttr{getBack(base), getFore(base)};
    return base;
}

class MessageLineView : public TView
{
public:
    MessageLineView(const TRect &bounds, const BrowserSession &session)
        : TView(bounds), session(session)
    {
        growMode = gfGrowHiX;
        options &= ~(ofSelectable | ofFirstClick);
    }

    void draw() override
    {
        TDrawBuffer buffer;
        const std::optional<StatusMessage> &current = overrideText ? overrideText : session.message();
        TColorAttr color = kInfoMessage;
        std::string text;
        if (current)
        {
            text = current->text;
            switch (current->kind)
            {
            case MessageKind::Error:
                color = kErrorMessage;
                break;
            case MessageKind::Warning:
                color = kWarningMessage;
                break;
            case MessageKind::Info:
                color = kInfoMessage;
                break;
            }
        }
        buffer.moveChar(0, ' ', color, size.x);
        int start = std::max(0, (size.x - static_cast<int>(text.size())) / 2);
        buffer.moveStr(static_cast<ushort>(start), text, color);
        writeLine(0, 0, size.x, 1, buffer);
    }

    // Shown until the next clearOverride(), regardless of the session message.
    void showTransient(std::string text)
    {
        overrideText = StatusMessage{std::move(text), MessageKind::Info};
        drawView();
    }

    void clearOverride()
    {
        overrideText.reset();
        drawView();
    }

private:
    const BrowserSession &session;
    std::optional<StatusMessage> overrideText;
};

struct ViewSettings
{
    bool showOwner = false;
    int gaugeWidth = 20;
    std::size_t pageStep = 10;
};

class ListingHeaderView : public TView
{
public:
    ListingHeaderView(const TRect &bounds, const BrowserSession &session)
        : TView(bounds), session(session)
    {
        growMode = gfGrowHiX;
        options &= ~(ofSelectable | ofFirstClick);
    }

    void draw() override
    {
        TDrawBuffer buffer;
        TColorAttr color{TColorBIOS(0x0), TColorBIOS(0x7), slBold};
        buffer.moveChar(0, ' ', color, size.x);
        if (session.isOpen())
        {
            const ListingStats &stats = session.listing().stats();
            std::string title = " " + session.currentDirectory().string() + " ━━ " +
                                sizeString(stats.totalSize) + ", " + entriesString(stats.totalEntries) + " files ";
            buffer.moveStr(0, title, color);
        }
        writeLine(0, 0, size.x, 1, buffer);
    }

private:
    const BrowserSession &session;
};

class ListingView : public TView
{
public:
    ListingView(const TRect &bounds, TScrollBar *vScroll, BrowserSession &session, const ViewSettings &settings)
        : TView(bounds), vScrollBar(vScroll), session(session), settings(settings)
    {
        growMode = gfGrowHiX | gfGrowHiY;
        options |= ofSelectable | ofFirstClick;
        eventMask |= evBroadcast | evMouseWheel;
    }

    void draw() override;
    void handleEvent(TEvent &event) override;
    void changeBounds(const TRect &bounds) override;

    // Re-reads the session after it replaced or re-sorted its listing.
    void refresh();

private:
    void drawRow(TDrawBuffer &buffer, const DirEntry &entry, bool selected, std::size_t userWidth,
                 std::size_t groupWidth) const;
    int drawGauge(TDrawBuffer &buffer, int x, const Gauge &gauge) const;
    void ensureSelectionVisible();
    void updateScrollBar();
    bool handleKey(TEvent &event);

    TScrollBar *vScrollBar = nullptr;
    BrowserSession &session;
    const ViewSettings &settings;
    std::size_t topRow = 0;
};

void ListingView::draw()
{
    const DirListing *listing = session.isOpen() ? &session.listing() : nullptr;

    std::size_t userWidth = 0;
    std::size_t groupWidth = 0;
    if (listing && settings.showOwner)
    {
        for (const DirEntry *entry : listing->displayOrder())
        {
            userWidth = std::max(userWidth, entry->owner.value_or("").size());
            groupWidth = std::max(groupWidth, entry->group.value_or("").size());
        }
    }

    std::optional<std::size_t> selected = listing ? listing->selected() : std::nullopt;
    for (int y = 0; y < size.y; ++y)
    {
        TDrawBuffer buffer;
        std::size_t row = topRow + static_cast<std::size_t>(y);
        if (!listing || row >= listing->size())
        {
            buffer.moveChar(0, ' ', kNormalText, size.x);
        }
        else
        {
            drawRow(buffer, listing->at(row), selected && *selected == row, userWidth, groupWidth);
        }
        writeLine(0, static_cast<short>(y), size.x, 1, buffer);
    }
}

void ListingView::drawRow(TDrawBuffer &buffer, const DirEntry &entry, bool selected, std::size_t userWidth,
                          std::size_t groupWidth) const
{
    const ListingStats &stats = session.listing().stats();
    TColorAttr text = selected ? kSelectedText : kNormalText;
    buffer.moveChar(0, ' ', text, size.x);

    double sizeFraction = safeFraction(entry.size.value_or(0), stats.maxSize);
    std::optional<double> sizePercent;
    if (entry.size)
        sizePercent = safeFraction(*entry.size, stats.totalSize);

    double entriesFraction = safeFraction(entry.rentries.value_or(0), stats.maxEntries);
    std::optional<double> entriesPercent;
    if (entry.rentries)
        entriesPercent = safeFraction(*entry.rentries, stats.totalEntries);

    int x = 0;
    x += buffer.moveStr(x, selected ? "> " : "  ", text);
    x += buffer.moveStr(x, padLeft(sizeString(entry.size, true), 8) + " ┃", text);
    x = drawGauge(buffer, x, renderGauge(sizeFraction, sizePercent, settings.gaugeWidth, selected));
    x += buffer.moveStr(x, "┃  " + padLeft(entriesString(entry.rentries, true), 7) + " ┃", text);
    x = drawGauge(buffer, x, renderGauge(entriesFraction, entriesPercent, settings.gaugeWidth, selected));
    x += buffer.moveStr(x, "┃", text);

    if (settings.showOwner)
    {
        if (entry.owner)
            x += buffer.moveStr(x, " " + padLeft(*entry.owner, userWidth), text);
        if (entry.group)
            x += buffer.moveStr(x, ":" + padRight(*entry.group, groupWidth), text);
    }
    if (session.sortMode().field == SortField::ChangeTime)
        x += buffer.moveStr(x, " " + padRight(changeTimeString(entry.changeTime), 16), text);

    buffer.moveStr(x, " " + entry.name, text);
}

int ListingView::drawGauge(TDrawBuffer &buffer, int x, const Gauge &gauge) const
{
    for (const GaugeSpan &span : gauge.spans)
    {
        buffer.moveStr(x, span.text, gaugeAttr(span.style, gauge.selected));
        x += span.cells;
    }
    return x;
}

void ListingView::handleEvent(TEvent &event)
{
    TView::handleEvent(event);

    if (event.what == evKeyDown)
    {
        if (handleKey(event))
            clearEvent(event);
        return;
    }

    if (!session.isOpen())
        return;
    DirListing &listing = session.listing();

    if (event.what == evMouseDown)
    {
        TPoint local = makeLocal(event.mouse.where);
        std::size_t row = topRow + static_cast<std::size_t>(std::max(0, static_cast<int>(local.y)));
        if (row < listing.size())
        {
            listing.saturatingSelect(row);
            drawView();
            if (event.mouse.eventFlags & meDoubleClick)
                postCommand(commands::EnterDirectory);
        }
        clearEvent(event);
    }
    else if (event.what == evMouseWheel)
    {
        if (event.mouse.wheel == mwUp)
            listing.selectPrev(3);
        else if (event.mouse.wheel == mwDown)
            listing.selectNext(3);
        ensureSelectionVisible();
        drawView();
        clearEvent(event);
    }
    else if (event.what == evBroadcast && event.message.command == cmScrollBarChanged &&
             event.message.infoPtr == vScrollBar)
    {
        topRow = static_cast<std::size_t>(std::max(0, vScrollBar->value));
        drawView();
    }
}

bool ListingView::handleKey(TEvent &event)
{
    const ushort keyCode = event.keyDown.keyCode;
    const char ch = event.keyDown.charScan.charCode;

    switch (keyCode)
    {
    case kbEsc:
        postCommand(cmQuit);
        return true;
    case kbEnter:
        postCommand(commands::EnterDirectory);
        return true;
    case kbBack:
        postCommand(commands::ParentDirectory);
        return true;
    default:
        break;
    }

    switch (ch)
    {
    case 'q':
        postCommand(cmQuit);
        return true;
    case 'h':
        postCommand(commands::ParentDirectory);
        return true;
    case ' ':
        postCommand(commands::OriginalDirectory);
        return true;
    case 'n':
        postCommand(commands::SortName);
        return true;
    case 's':
        postCommand(commands::SortSize);
        return true;
    case 'c':
    case 'C':
        postCommand(commands::SortEntries);
        return true;
    case 'U':
        postCommand(commands::SortOwner);
        return true;
    case 't':
        postCommand(commands::SortChangeTime);
        return true;
    case 'u':
        postCommand(commands::ToggleOwner);
        return true;
    case '?':
        postCommand(commands::HelpKeys);
        return true;
    default:
        break;
    }

    if (!session.isOpen())
        return false;
    DirListing &listing = session.listing();

    if (keyCode == kbDown || ch == 'j')
        listing.selectNext(1);
    else if (keyCode == kbUp || ch == 'k')
        listing.selectPrev(1);
    else if (keyCode == kbPgDn)
        listing.selectNext(settings.pageStep);
    else if (keyCode == kbPgUp)
        listing.selectPrev(settings.pageStep);
    else if (keyCode == kbHome || ch == 'g')
        listing.selectFirst();
    else if (keyCode == kbEnd || ch == 'G')
        listing.selectLast();
    else
        return false;

    ensureSelectionVisible();
    drawView();
    return true;
}

void ListingView::changeBounds(const TRect &bounds)
{
    TView::changeBounds(bounds);
    ensureSelectionVisible();
}

void ListingView::refresh()
{
    topRow = 0;
    ensureSelectionVisible();
    drawView();
}

void ListingView::ensureSelectionVisible()
{
    if (session.isOpen())
    {
        const DirListing &listing = session.listing();
        std::size_t height = static_cast<std::size_t>(std::max(1, static_cast<int>(size.y)));
        if (std::optional<std::size_t> selected = listing.selected())
        {
            if (*selected < topRow)
                topRow = *selected;
            else if (*selected >= topRow + height)
                topRow = *selected - height + 1;
        }
        std::size_t maxTop = listing.size() > height ? listing.size() - height : 0;
        topRow = std::min(topRow, maxTop);
    }
    else
    {
        topRow = 0;
    }
    updateScrollBar();
}

void ListingView::updateScrollBar()
{
    if (!vScrollBar)
        return;
    int rows = session.isOpen() ? static_cast<int>(std::min<std::size_t>(session.listing().size(), INT_MAX)) : 0;
    int height = std::max(1, static_cast<int>(size.y));
    int maxTop = std::max(0, rows - height);
    vScrollBar->setParams(static_cast<int>(std::min<std::size_t>(topRow, INT_MAX)), 0, maxTop,
                          std::max(1, height - 1), 1);
}

class ListingWindow : public TWindow
{
public:
    ListingWindow(const TRect &bounds, BrowserSession &session, const ViewSettings &settings)
        : TWindowInit(&TWindow::initFrame),
          TWindow(bounds, "cephdu " CEPHDU_VERSION, wnNoNumber)
    {
        flags = 0;
        growMode = gfGrowHiX | gfGrowHiY;

        TRect client = getExtent();
        client.grow(-1, -1);

        vScroll = standardScrollBar(sbVertical);
        header = new ListingHeaderView(TRect(client.a.x, client.a.y, client.b.x, client.a.y + 1), session);
        list = new ListingView(TRect(client.a.x, client.a.y + 1, client.b.x, client.b.y), vScroll, session,
                               settings);
        insert(header);
        insert(list);
        list->select();
    }

    void refresh()
    {
        header->drawView();
        list->refresh();
    }

    void redrawRows()
    {
        header->drawView();
        list->drawView();
    }

private:
    TScrollBar *vScroll = nullptr;
    ListingHeaderView *header = nullptr;
    ListingView *list = nullptr;
};

class HelpTextView : public TView
{
public:
    HelpTextView(const TRect &bounds, TScrollBar *vScroll, PopupText text)
        : TView(bounds), vScrollBar(vScroll), text(std::move(text)),
          scroll(this->text.height(), static_cast<std::size_t>(bounds.b.y - bounds.a.y))
    {
        options |= ofSelectable;
        eventMask |= evBroadcast;
        syncScrollBar();
    }

    void draw() override
    {
        TColorAttr color = getColor(1);
        for (int y = 0; y < size.y; ++y)
        {
            TDrawBuffer buffer;
            buffer.moveChar(0, ' ', color, size.x);
            std::size_t line = scroll.offset() + static_cast<std::size_t>(y);
            if (line < text.lines.size())
            {
                const std::string &content = text.lines[line];
                int start = std::max(0, (size.x - static_cast<int>(content.size())) / 2);
                buffer.moveStr(static_cast<ushort>(start), content, color);
            }
            writeLine(0, static_cast<short>(y), size.x, 1, buffer);
        }
    }

    void handleEvent(TEvent &event) override
    {
        TView::handleEvent(event);
        if (event.what == evBroadcast && event.message.command == cmScrollBarChanged &&
            event.message.infoPtr == vScrollBar)
        {
            scroll.scrollTo(static_cast<std::size_t>(std::max(0, vScrollBar->value)));
            drawView();
            return;
        }
        if (event.what != evKeyDown)
            return;

        const ushort keyCode = event.keyDown.keyCode;
        const char ch = event.keyDown.charScan.charCode;
        if (keyCode == kbEsc || keyCode == kbEnter || ch == 'q' || ch == '?')
        {
            endModal(cmCancel);
            clearEvent(event);
            return;
        }

        if (keyCode == kbDown || ch == 'j')
            scroll.scrollBy(1);
        else if (keyCode == kbUp || ch == 'k')
            scroll.scrollBy(-1);
        else if (keyCode == kbPgDn)
            scroll.scrollBy(static_cast<std::ptrdiff_t>(kPopupTextHeight));
        else if (keyCode == kbPgUp)
            scroll.scrollBy(-static_cast<std::ptrdiff_t>(kPopupTextHeight));
        else if (keyCode == kbHome || ch == 'g')
            scroll.scrollTo(0);
        else if (keyCode == kbEnd || ch == 'G')
            scroll.scrollTo(scroll.maxOffset());
        else
            return;

        syncScrollBar();
        drawView();
        clearEvent(event);
    }

private:
    void syncScrollBar()
    {
        if (vScrollBar)
            vScrollBar->setParams(static_cast<int>(scroll.offset()), 0, static_cast<int>(scroll.maxOffset()),
                                  static_cast<int>(kPopupTextHeight), 1);
    }

    TScrollBar *vScrollBar = nullptr;
    PopupText text;
    PopupScroll scroll;
};

TDialog *createHelpDialog(const PopupText &text)
{
    int width = static_cast<int>(text.width()) + 4;
    int height = static_cast<int>(kPopupTextHeight) + 4;
    TDialog *d = new TDialog(TRect(0, 0, width + 2, height), text.title);
    d->options |= ofCentered;

    auto *vScroll = new TScrollBar(TRect(width, 1, width + 1, 1 + static_cast<int>(kPopupTextHeight)));
    auto *view = new HelpTextView(TRect(2, 1, width - 1, 1 + static_cast<int>(kPopupTextHeight)), vScroll, text);
    d->insert(vScroll);
    d->insert(view);
    std::string bottom = "\003" + text.bottomTitle;
    d->insert(new TStaticText(TRect(2, height - 2, width - 1, height - 1), bottom));
    view->select();
    return d;
}

class CephDuStatusLine : public cephdu::ui::CommandAwareStatusLine
{
public:
    CephDuStatusLine(TRect r)
        : cephdu::ui::CommandAwareStatusLine(r, *new TStatusDef(0, 0xFFFF, nullptr))
    {
        items = buildHintChain();
        defs->items = items;
    }

private:
    static TStatusItem *buildHintChain()
    {
        auto *help = new TStatusItem("~?~ Help", kbNoKey, commands::HelpKeys);
        auto *open = new TStatusItem("~Enter~ Open", kbNoKey, commands::EnterDirectory);
        auto *parent = new TStatusItem("~Bksp~ Parent", kbNoKey, commands::ParentDirectory);
        auto *sortSize = new TStatusItem("~s~ Size", kbNoKey, commands::SortSize);
        auto *sortEntries = new TStatusItem("~c~ Entries", kbNoKey, commands::SortEntries);
        auto *sortName = new TStatusItem("~n~ Name", kbNoKey, commands::SortName);
        auto *owner = new TStatusItem("~u~ Owner", kbNoKey, commands::ToggleOwner);
        auto *quit = new TStatusItem("~q~ Quit", kbNoKey, cmQuit);
        help->next = open;
        open->next = parent;
        parent->next = sortSize;
        sortSize->next = sortEntries;
        sortEntries->next = sortName;
        sortName->next = owner;
        owner->next = quit;
        return help;
    }
};

} // namespace

class CephDuApp : public TApplication
{
public:
    CephDuApp(std::shared_ptr<BrowserSession> session, std::shared_ptr<config::OptionRegistry> registry);

    void handleEvent(TEvent &event) override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

private:
    std::shared_ptr<BrowserSession> session;
    std::shared_ptr<config::OptionRegistry> optionRegistry;
    CephDuOptions currentOptions;
    ViewSettings viewSettings;
    MessageLineView *messageLine = nullptr;
    ListingWindow *listingWindow = nullptr;
    KeyPoller<TEvent> keyPoller;

    template <typename Change>
    void runDirectoryChange(Change change);
    ListingLoadOptions makeLoadOptions(std::size_t &skipped);
    void replayTypeahead();
    void refreshViews();
    void requestSort(SortField field);
    void toggleOwner();
    void promptOpenDirectory();
    void showHelp();
    void showAbout();
    void updateSortMenu();
    void updateViewMenu();
    void loadOptionsFromFile();
    void saveOptionsToFile();
    void saveDefaultOptions();
    void storeViewState();
    void reloadOptionState();
};

CephDuApp::CephDuApp(std::shared_ptr<BrowserSession> sessionIn, std::shared_ptr<config::OptionRegistry> registry)
    : TProgInit(&CephDuApp::initStatusLine, &CephDuApp::initMenuBar, &TApplication::initDeskTop),
      session(std::move(sessionIn)), optionRegistry(std::move(registry)),
      keyPoller(kPollInterval, readPendingKey, isCancelKey)
{
    currentOptions = optionsFromRegistry(*optionRegistry);
    viewSettings.showOwner = currentOptions.showOwner;
    viewSettings.gaugeWidth = currentOptions.gaugeWidth;
    viewSettings.pageStep = currentOptions.pageStep;

    TRect deskBounds = deskTop->getBounds();
    TRect messageBounds(deskBounds.a.x, deskBounds.a.y, deskBounds.b.x, deskBounds.a.y + 1);
    deskBounds.a.y += 1;
    deskTop->changeBounds(deskBounds);
    messageLine = new MessageLineView(messageBounds, *session);
    insert(messageLine);

    listingWindow = new ListingWindow(deskTop->getExtent(), *session, viewSettings);
    deskTop->insert(listingWindow);

    updateSortMenu();
    updateViewMenu();
    refreshViews();
}

void CephDuApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what != evCommand)
        return;

    switch (event.message.command)
    {
    case commands::OpenDirectory:
        promptOpenDirectory();
        break;
    case commands::EnterDirectory:
        runDirectoryChange([this](const ListingLoadOptions &options) { session->enterSelected(options); });
        break;
    case commands::ParentDirectory:
        runDirectoryChange([this](const ListingLoadOptions &options) { session->goToParent(options); });
        break;
    case commands::OriginalDirectory:
        runDirectoryChange([this](const ListingLoadOptions &options) { session->returnToOrigin(options); });
        break;
    case commands::Reload:
        runDirectoryChange([this](const ListingLoadOptions &options) { session->reload(options); });
        break;
    case commands::SortName:
        requestSort(SortField::Name);
        break;
    case commands::SortSize:
        requestSort(SortField::Size);
        break;
    case commands::SortEntries:
        requestSort(SortField::RecursiveEntryCount);
        break;
    case commands::SortOwner:
        requestSort(SortField::Owner);
        break;
    case commands::SortChangeTime:
        requestSort(SortField::ChangeTime);
        break;
    case commands::ToggleOwner:
        toggleOwner();
        break;
    case commands::HelpKeys:
        showHelp();
        break;
    case commands::About:
        showAbout();
        break;
    case commands::OptionLoad:
        loadOptionsFromFile();
        break;
    case commands::OptionSave:
        saveOptionsToFile();
        break;
    case commands::OptionSaveDefaults:
        saveDefaultOptions();
        break;
    default:
        return;
    }
    clearEvent(event);
}

template <typename Change>
void CephDuApp::runDirectoryChange(Change change)
{
    messageLine->showTransient("Loading... (Ctrl-C to interrupt)");
    TScreen::flushScreen();

    std::size_t skipped = 0;
    change(makeLoadOptions(skipped));

    messageLine->clearOverride();
    if (skipped > 0 && !session->message())
        session->setMessage(StatusMessage{"Skipped " + std::to_string(skipped) + " unreadable entries",
                                          MessageKind::Info});
    refreshViews();
    replayTypeahead();
}

void CephDuApp::replayTypeahead()
{
    for (TEvent &key : keyPoller.takePending())
    {
        if (statusLine)
            statusLine->handleEvent(key);
        if (key.what != evNothing)
            handleEvent(key);
    }
}

ListingLoadOptions CephDuApp::makeLoadOptions(std::size_t &skipped)
{
    ListingLoadOptions options;
    options.cancelRequested = [this]() { return keyPoller.poll(); };
    options.errorCallback = [&skipped](const std::filesystem::path &, const std::error_code &) { ++skipped; };
    return options;
}

void CephDuApp::refreshViews()
{
    if (listingWindow)
        listingWindow->refresh();
    if (messageLine)
        messageLine->drawView();
    updateSortMenu();
}

void CephDuApp::requestSort(SortField field)
{
    session->requestSort(field);
    updateSortMenu();
    if (listingWindow)
        listingWindow->refresh();
}

void CephDuApp::toggleOwner()
{
    viewSettings.showOwner = !viewSettings.showOwner;
    updateViewMenu();
    if (listingWindow)
        listingWindow->redrawRows();
}

void CephDuApp::promptOpenDirectory()
{
    struct DialogData
    {
        char path[PATH_MAX];
    } data{};

    std::snprintf(data.path, sizeof(data.path), "%s", session->currentDirectory().string().c_str());

    TDialog *d = new TDialog(TRect(0, 0, 60, 10), "Open Directory");
    d->options |= ofCentered;
    auto *input = new TInputLine(TRect(3, 3, 55, 4), sizeof(data.path) - 1);
    d->insert(input);
    d->insert(new TLabel(TRect(2, 2, 20, 3), "~P~ath:", input));
    d->insert(new TButton(TRect(15, 6, 25, 8), "O~K~", cmOK, bfDefault));
    d->insert(new TButton(TRect(27, 6, 37, 8), "Cancel", cmCancel, bfNormal));

    if (executeDialog(d, &data) == cmCancel)
        return;
    std::filesystem::path target = data.path;
    runDirectoryChange([this, &target](const ListingLoadOptions &options) {
        session->changeDirectory(target, options);
    });
}

void CephDuApp::showHelp()
{
    PopupText text("Help", "cephdu " CEPHDU_VERSION, helpText());
    executeDialog(createHelpDialog(text), nullptr);
}

void CephDuApp::showAbout()
{
    messageBox("\003cephdu " CEPHDU_VERSION "\n\n\003Recursive usage browser for CephFS",
               mfInformation | mfOKButton);
}

void CephDuApp::updateSortMenu()
{
    SortMode current = session->sortMode();
    for (std::size_t i = 0; i < kSortBaseLabels.size(); ++i)
    {
        TMenuItem *item = gSortMenuItems[i];
        if (!item)
            continue;
        const auto &[field, base] = kSortBaseLabels[i];
        std::string label;
        if (field == current.field)
            label = std::string("● ") + base + (current.reversed ? " (descending)" : " (ascending)");
        else
            label = std::string("  ") + base;
        delete[] const_cast<char *>(item->name);
        item->name = newStr(label.c_str());
    }
    if (menuBar)
        menuBar->drawView();
}

void CephDuApp::updateViewMenu()
{
    if (!gShowOwnerMenuItem)
        return;
    std::string label = std::string(viewSettings.showOwner ? "[x] " : "[ ] ") + "Show ~O~wner";
    delete[] const_cast<char *>(gShowOwnerMenuItem->name);
    gShowOwnerMenuItem->name = newStr(label.c_str());
    if (menuBar)
        menuBar->drawView();
}

void CephDuApp::loadOptionsFromFile()
{
    struct DialogData
    {
        char path[PATH_MAX];
    } data{};

    std::filesystem::path configPath = config::OptionRegistry::configRoot() / "options.json";
    std::snprintf(data.path, sizeof(data.path), "%s", configPath.string().c_str());

    TDialog *d = new TDialog(TRect(0, 0, 68, 10), "Load Options");
    d->options |= ofCentered;
    auto *input = new TInputLine(TRect(3, 4, 64, 5), sizeof(data.path) - 1);
    d->insert(new TLabel(TRect(2, 3, 20, 4), "~F~ile:", input));
    d->insert(input);
    d->insert(new TButton(TRect(18, 6, 28, 8), "O~K~", cmOK, bfDefault));
    d->insert(new TButton(TRect(30, 6, 40, 8), "Cancel", cmCancel, bfNormal));

    if (executeDialog(d, &data) != cmOK)
        return;

    std::filesystem::path path = data.path;
    if (!optionRegistry->loadFromFile(path))
    {
        std::string message = "Failed to load options:\n" + path.string();
        messageBox(message.c_str(), mfError | mfOKButton);
        return;
    }
    reloadOptionState();
    std::string success = "Options loaded from:\n" + path.string();
    messageBox(success.c_str(), mfInformation | mfOKButton);
}

void CephDuApp::saveOptionsToFile()
{
    struct DialogData
    {
        char path[PATH_MAX];
    } data{};

    std::filesystem::path configPath = config::OptionRegistry::configRoot() / "options.json";
    std::snprintf(data.path, sizeof(data.path), "%s", configPath.string().c_str());

    TDialog *d = new TDialog(TRect(0, 0, 68, 10), "Save Options");
    d->options |= ofCentered;
    auto *input = new TInputLine(TRect(3, 4, 64, 5), sizeof(data.path) - 1);
    d->insert(new TLabel(TRect(2, 3, 20, 4), "~F~ile:", input));
    d->insert(input);
    d->insert(new TButton(TRect(18, 6, 28, 8), "O~K~", cmOK, bfDefault));
    d->insert(new TButton(TRect(30, 6, 40, 8), "Cancel", cmCancel, bfNormal));

    if (executeDialog(d, &data) != cmOK)
        return;

    storeViewState();
    std::filesystem::path path = data.path;
    if (!optionRegistry->saveToFile(path))
    {
        std::string message = "Failed to save options:\n" + path.string();
        messageBox(message.c_str(), mfError | mfOKButton);
        return;
    }
    std::string success = "Options saved to:\n" + path.string();
    messageBox(success.c_str(), mfInformation | mfOKButton);
}

void CephDuApp::saveDefaultOptions()
{
    storeViewState();
    std::filesystem::path dest = optionRegistry->defaultOptionsPath();
    if (optionRegistry->saveDefaults())
    {
        std::string message = "Defaults saved to:\n" + dest.string();
        messageBox(message.c_str(), mfInformation | mfOKButton);
    }
    else
    {
        std::string message = "Failed to save defaults:\n" + dest.string();
        messageBox(message.c_str(), mfError | mfOKButton);
    }
}

void CephDuApp::storeViewState()
{
    optionRegistry->set(kOptionShowOwner, config::OptionValue(viewSettings.showOwner));
    optionRegistry->set(kOptionSortField, config::OptionValue(std::string(sortFieldName(session->sortMode().field))));
}

void CephDuApp::reloadOptionState()
{
    currentOptions = optionsFromRegistry(*optionRegistry);
    viewSettings.showOwner = currentOptions.showOwner;
    viewSettings.gaugeWidth = currentOptions.gaugeWidth;
    viewSettings.pageStep = currentOptions.pageStep;
    if (session->sortMode().field != currentOptions.sortField)
        session->applySortMode(defaultSortMode(currentOptions.sortField));
    spdlog::info("options reloaded; attribute names apply from the next start");

    updateViewMenu();
    refreshViews();
}

TMenuBar *CephDuApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;
    auto *sortName = new TMenuItem("~N~ame", commands::SortName, kbNoKey, commands::SortName);
    auto *sortSize = new TMenuItem("~S~ize", commands::SortSize, kbNoKey, commands::SortSize);
    auto *sortEntries = new TMenuItem("~E~ntries", commands::SortEntries, kbNoKey, commands::SortEntries);
    auto *sortOwner = new TMenuItem("~O~wner", commands::SortOwner, kbNoKey, commands::SortOwner);
    auto *sortTime = new TMenuItem("Change ~T~ime", commands::SortChangeTime, kbNoKey, commands::SortChangeTime);
    gSortMenuItems = {sortName, sortSize, sortEntries, sortOwner, sortTime};
    gShowOwnerMenuItem = new TMenuItem("Show ~O~wner", commands::ToggleOwner, kbNoKey, commands::ToggleOwner);

    TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                         *new TMenuItem("~O~pen Directory...", commands::OpenDirectory, kbNoKey,
                                        commands::OpenDirectory) +
                         *new TMenuItem("~P~arent Directory", commands::ParentDirectory, kbNoKey,
                                        commands::ParentDirectory) +
                         *new TMenuItem("Ori~g~inal Directory", commands::OriginalDirectory, kbNoKey,
                                        commands::OriginalDirectory) +
                         *new TMenuItem("~R~eload", commands::Reload, kbNoKey, commands::Reload) +
                         newLine() +
                         *new TMenuItem("E~x~it", cmQuit, kbNoKey, hcExit);

    TMenuItem &menuChain = fileMenu +
                           *new TSubMenu("~S~ort", hcNoContext) +
                               *sortName +
                               *sortSize +
                               *sortEntries +
                               *sortOwner +
                               *sortTime +
                           *new TSubMenu("~V~iew", hcNoContext) +
                               *gShowOwnerMenuItem +
                           *new TSubMenu("Op~t~ions", hcNoContext) +
                               *new TMenuItem("~L~oad Options...", commands::OptionLoad, kbNoKey,
                                              commands::OptionLoad) +
                               *new TMenuItem("~S~ave Options...", commands::OptionSave, kbNoKey,
                                              commands::OptionSave) +
                               *new TMenuItem("Save ~D~efaults", commands::OptionSaveDefaults, kbNoKey,
                                              commands::OptionSaveDefaults) +
                           *new TSubMenu("~H~elp", hcNoContext) +
                               *new TMenuItem("~K~eys", commands::HelpKeys, kbNoKey, commands::HelpKeys) +
                               *new TMenuItem("~A~bout", commands::About, kbNoKey, commands::About);

    return new TMenuBar(r, static_cast<TSubMenu &>(menuChain));
}

TStatusLine *CephDuApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new CephDuStatusLine(r);
}

namespace
{

void printUsage()
{
    std::cout << "cephdu - browse CephFS recursive usage\n\n"
              << "Usage: cephdu [options] [path]\n"
              << "  -h, --help             Show this help and exit\n"
              << "  -V, --version          Show the version and exit\n"
              << "  -u, --show-owner       Show the owner:group column\n"
              << "  -s, --sort FIELD       Sort by name, size, entries, owner or ctime\n"
              << "  --load-options FILE    Load options from FILE\n"
              << "  --no-default-options   Do not load saved defaults\n"
              << "  --log-file FILE        Write the log to FILE\n"
              << "  --log-level LEVEL      trace, debug, info, warn, error, critical or off\n\n"
              << "Without a path, " << kCephUsersRoot << "/$USER is opened." << std::endl;
}

// Accepts "--name VALUE" and "--name=VALUE".
bool takeValue(const std::string &arg, const std::string &name, int &i, int argc, char **argv,
               std::optional<std::string> &value)
{
    const std::string prefix = name + "=";
    if (arg == name)
    {
        if (i + 1 >= argc)
        {
            std::cerr << "cephdu: " << name << " requires a value" << std::endl;
            return false;
        }
        value = argv[++i];
        return true;
    }
    if (arg.rfind(prefix, 0) == 0)
    {
        value = arg.substr(prefix.size());
        return true;
    }
    std::cerr << "cephdu: unknown option '" << arg << "'" << std::endl;
    return false;
}

} // namespace

int main(int argc, char **argv)
{
    logging::installStartupLogger();

    auto registry = std::make_shared<config::OptionRegistry>("cephdu");
    registerCephDuOptions(*registry);

    bool loadDefaults = true;
    bool showOwner = false;
    std::vector<std::filesystem::path> optionFiles;
    std::optional<std::string> sortOverride;
    std::optional<std::string> logFileOverride;
    std::optional<std::string> logLevelOverride;
    std::optional<std::filesystem::path> explicitPath;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            printUsage();
            return 0;
        }
        if (arg == "-V" || arg == "--version")
        {
            std::cout << "cephdu " << CEPHDU_VERSION << std::endl;
            return 0;
        }
        if (arg == "-u" || arg == "--show-owner")
        {
            showOwner = true;
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg == "-s")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "cephdu: -s requires a field" << std::endl;
                return 1;
            }
            sortOverride = argv[++i];
        }
        else if (arg.rfind("--sort", 0) == 0)
        {
            if (!takeValue(arg, "--sort", i, argc, argv, sortOverride))
                return 1;
        }
        else if (arg.rfind("--load-options", 0) == 0)
        {
            std::optional<std::string> file;
            if (!takeValue(arg, "--load-options", i, argc, argv, file))
                return 1;
            if (!file || file->empty())
            {
                std::cerr << "cephdu: invalid --load-options usage" << std::endl;
                return 1;
            }
            optionFiles.emplace_back(*file);
        }
        else if (arg.rfind("--log-file", 0) == 0)
        {
            if (!takeValue(arg, "--log-file", i, argc, argv, logFileOverride))
                return 1;
        }
        else if (arg.rfind("--log-level", 0) == 0)
        {
            if (!takeValue(arg, "--log-level", i, argc, argv, logLevelOverride))
                return 1;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << "cephdu: unknown option '" << arg << "'" << std::endl;
            return 1;
        }
        else if (explicitPath)
        {
            std::cerr << "cephdu: only one path may be given" << std::endl;
            return 1;
        }
        else
        {
            explicitPath = std::filesystem::path(arg);
        }
    }

    if (loadDefaults)
        registry->loadDefaults();
    for (const auto &file : optionFiles)
    {
        if (!registry->loadFromFile(file))
        {
            std::cerr << "cephdu: failed to load options from '" << file.string() << "'" << std::endl;
            return 1;
        }
    }

    if (sortOverride)
    {
        if (!sortFieldFromString(*sortOverride))
        {
            std::cerr << "cephdu: unknown sort field '" << *sortOverride << "'" << std::endl;
            return 1;
        }
        registry->set(kOptionSortField, config::OptionValue(*sortOverride));
    }
    if (showOwner)
        registry->set(kOptionShowOwner, config::OptionValue(true));
    if (logFileOverride)
        registry->set(kOptionLogFile, config::OptionValue(*logFileOverride));
    if (logLevelOverride)
        registry->set(kOptionLogLevel, config::OptionValue(*logLevelOverride));

    CephDuOptions options = optionsFromRegistry(*registry);
    logging::LogSettings logSettings;
    logSettings.level = options.logLevel;
    logSettings.file = options.logFile;
    if (!logging::initialize(logSettings) &&
        logging::parseLevel(logSettings.level, spdlog::level::warn) != spdlog::level::off)
        std::cerr << "cephdu: cannot open log file, logging disabled" << std::endl;

    auto probe = std::make_shared<MetadataProbe>(systemAttributeSource(), options.attributes);
    auto session = std::make_shared<BrowserSession>(probe, defaultSortMode(options.sortField));

    std::filesystem::path path = explicitPath ? *explicitPath : startupPath(options);
    if (session->open(path) != ListingLoadStatus::Loaded)
    {
        std::string reason = session->lastError().message();
        spdlog::warn("cannot open '{}': {}, falling back to '.'", path.string(), reason);
        if (session->open(".") != ListingLoadStatus::Loaded)
        {
            std::cerr << "cephdu: Error opening " << path << ": " << reason << std::endl;
            return 1;
        }
        if (explicitPath)
            session->setMessage(
                StatusMessage{"Error opening \"" + path.string() + "\": " + reason, MessageKind::Warning});
    }

    CephDuApp app(session, registry);
    app.run();
    return 0;
}
