#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lm::text
{

struct TextRange
{
    std::size_t from = 0;
    std::size_t to = 0;

    bool empty() const noexcept { return to <= from; }
    std::size_t length() const noexcept { return to > from ? to - from : 0; }
    bool contains(std::size_t pos) const noexcept { return pos >= from && pos < to; }
    bool touches(const TextRange &other) const noexcept { return other.from <= to && other.to >= from; }
    bool operator==(const TextRange &) const = default;
};

// A line never includes its terminating '\n'.
struct LineInfo
{
    std::size_t from = 0;
    std::size_t to = 0;
    std::size_t number = 0;

    bool contains(std::size_t pos) const noexcept { return pos >= from && pos <= to; }
    bool operator==(const LineInfo &) const = default;
};

struct TextChange
{
    std::size_t from = 0;
    std::size_t to = 0;
    std::string insert;

    bool operator==(const TextChange &) const = default;
};

struct Selection
{
    std::size_t anchor = 0;
    std::size_t head = 0;

    bool empty() const noexcept { return anchor == head; }
    std::size_t from() const noexcept { return anchor < head ? anchor : head; }
    std::size_t to() const noexcept { return anchor < head ? head : anchor; }
    bool operator==(const Selection &) const = default;
};

// Changes are expressed against the document as it was before the
// transaction; they must not overlap.
struct EditTransaction
{
    std::vector<TextChange> changes;
    std::optional<Selection> selection;
};

class TextSource
{
public:
    virtual ~TextSource() = default;

    virtual std::size_t length() const noexcept = 0;
    virtual std::string slice(std::size_t from, std::size_t to) const = 0;
    virtual LineInfo lineAt(std::size_t pos) const = 0;
    virtual std::uint64_t revision() const noexcept = 0;

    std::string lineText(const LineInfo &line) const { return slice(line.from, line.to); }
    std::string toString() const { return slice(0, length()); }
};

class TextDocument : public TextSource
{
public:
    TextDocument();
    explicit TextDocument(std::string initial);

    std::size_t length() const noexcept override { return content.size(); }
    std::string slice(std::size_t from, std::size_t to) const override;
    LineInfo lineAt(std::size_t pos) const override;
    std::uint64_t revision() const noexcept override { return rev; }

    const std::string &text() const noexcept { return content; }
    std::size_t lineCount() const noexcept { return lineStarts.size(); }
    LineInfo line(std::size_t number) const;

    bool apply(const EditTransaction &transaction);
    void reset(std::string replacement);

private:
    void rebuildLineIndex();

    std::string content;
    std::vector<std::size_t> lineStarts;
    std::uint64_t rev = 0;
};

bool changesAreValid(const std::vector<TextChange> &changes, std::size_t documentLength);
std::vector<TextChange> sortedDescending(std::vector<TextChange> changes);
std::size_t mapThroughChanges(const std::vector<TextChange> &changes, std::size_t pos);

} // namespace lm::text
