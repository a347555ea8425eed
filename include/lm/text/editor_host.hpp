#pragma once

#include "lm/text/text_document.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace lm::text
{

// The host editor owns the buffer. Everything else reads through text()
// and mutates only through dispatch().
class EditorHost
{
public:
    virtual ~EditorHost() = default;

    virtual const TextSource &text() const = 0;
    virtual std::size_t caret() const = 0;
    virtual TextRange viewport() const = 0;
    virtual bool dispatch(const EditTransaction &transaction) = 0;
    virtual void setSelection(std::size_t anchor, std::size_t head) = 0;
    virtual void scrollIntoView(std::size_t pos) = 0;
};

// Raw gap buffer primitives of a host editor.
class EditBuffer
{
public:
    virtual ~EditBuffer() = default;

    virtual std::size_t size() const = 0;
    virtual bool reserve(std::size_t capacity) = 0;
    virtual void erase(std::size_t from, std::size_t to) = 0;
    virtual bool insert(std::size_t at, std::string_view text) = 0;
};

// Applies every change of the transaction or none of them. On a failed
// insert the buffer is restored to |previous|, its content beforehand.
bool applyOrRestore(EditBuffer &buffer, const EditTransaction &transaction, std::string_view previous);

class MemoryEditorHost : public EditorHost
{
public:
    MemoryEditorHost() = default;
    explicit MemoryEditorHost(std::string initial);

    const TextSource &text() const override { return document; }
    std::size_t caret() const override { return current.head; }
    TextRange viewport() const override;
    bool dispatch(const EditTransaction &transaction) override;
    void setSelection(std::size_t anchor, std::size_t head) override;
    void scrollIntoView(std::size_t pos) override;

    const TextDocument &doc() const noexcept { return document; }
    const std::string &str() const noexcept { return document.text(); }
    Selection selection() const noexcept { return current; }
    void setCaret(std::size_t pos) { setSelection(pos, pos); }
    void setViewport(TextRange range) { fixedViewport = range; }
    void clearViewport() noexcept { fixedViewport.reset(); }
    std::optional<std::size_t> lastScrollTarget() const noexcept { return scrollTarget; }
    std::size_t dispatchCount() const noexcept { return dispatched; }

private:
    TextDocument document;
    Selection current;
    std::optional<TextRange> fixedViewport;
    std::optional<std::size_t> scrollTarget;
    std::size_t dispatched = 0;
};

} // namespace lm::text
