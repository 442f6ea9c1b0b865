#pragma once

#include <vector>

#include "document/Element.hpp"

// A parsed document as seen by the painters: a flat list of top-level items.
// Items are owned by the document and must outlive any layer set painted from it.
class PaintableDocument
{
public:
    virtual ~PaintableDocument() = default;

    [[nodiscard]] virtual std::vector<const Element*> Items() const = 0;
};
