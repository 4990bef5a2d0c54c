// ============================================================================
// History - Implementation
// ============================================================================

#include "History.h"
#include "Document.h"

#include <QDebug>

void History::push(HistoryCommand::Action action, const QString& pageId, const PageElement& element)
{
    HistoryCommand command;
    command.action = action;
    command.pageId = pageId;
    command.element = cloneElement(element);

    m_undoStack.push_back(std::move(command));
    m_redoStack.clear();
}

bool History::undo(Document& document)
{
    if (m_undoStack.empty()) {
        return false;
    }

    HistoryCommand command = std::move(m_undoStack.back());
    m_undoStack.pop_back();

    switch (command.action) {
        case HistoryCommand::Insert:
            apply(document, command, false);
            break;
        case HistoryCommand::Delete:
            apply(document, command, true);
            break;
    }

    m_redoStack.push_back(std::move(command));
    return true;
}

bool History::redo(Document& document)
{
    if (m_redoStack.empty()) {
        return false;
    }

    HistoryCommand command = std::move(m_redoStack.back());
    m_redoStack.pop_back();

    switch (command.action) {
        case HistoryCommand::Insert:
            apply(document, command, true);
            break;
        case HistoryCommand::Delete:
            apply(document, command, false);
            break;
    }

    m_undoStack.push_back(std::move(command));
    return true;
}

void History::clear()
{
    m_undoStack.clear();
    m_redoStack.clear();
}

QString History::nextUndoPageId() const
{
    return m_undoStack.empty() ? QString() : m_undoStack.back().pageId;
}

QString History::nextRedoPageId() const
{
    return m_redoStack.empty() ? QString() : m_redoStack.back().pageId;
}

void History::apply(Document& document, const HistoryCommand& command, bool insertElement)
{
    Page* page = document.findPageById(command.pageId);
    if (!page || !command.element) {
        qDebug() << "[History] Page" << command.pageId << "no longer exists, skipping";
        return;
    }

    if (insertElement) {
        // Element ids stay unique within a page
        if (page->findElement(command.element->id)) {
            return;
        }
        page->addElement(cloneElement(*command.element));
    } else {
        page->removeElement(command.element->id);
    }
}
