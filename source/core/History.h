#pragma once

// ============================================================================
// History - Document-wide undo/redo of element insertions and deletions
// ============================================================================
// Each command stores a detached deep clone of the element, so later edits to
// the live element never leak into history. Applying a command always inserts
// a fresh clone, never the stored snapshot itself.
//
// Only element insert/delete is journaled. Page structure edits (add, remove,
// reorder) and property edits (geometry, opacity, visibility, text) are not.
// ============================================================================

#include "../objects/PageElement.h"

#include <QString>
#include <vector>
#include <memory>

class Document;

/**
 * @brief A single undoable element insertion or deletion.
 */
struct HistoryCommand {
    enum Action {
        Insert,     ///< Element was inserted (undo = remove it)
        Delete      ///< Element was deleted (undo = insert it back)
    };

    Action action = Insert;
    QString pageId;                         ///< uid of the page the element lives on
    std::unique_ptr<PageElement> element;   ///< Detached snapshot
};

class History {
public:
    History() = default;

    History(const History&) = delete;
    History& operator=(const History&) = delete;

    /**
     * @brief Record an action.
     * @param action Insert or Delete.
     * @param pageId uid of the affected page.
     * @param element The element as it was inserted or deleted (cloned here).
     *
     * Clears the redo stack.
     */
    void push(HistoryCommand::Action action, const QString& pageId, const PageElement& element);

    /**
     * @brief Revert the most recent command.
     * @return False if there was nothing to undo.
     *
     * A command whose page no longer exists is skipped silently but still
     * moves to the redo stack.
     */
    bool undo(Document& document);

    /**
     * @brief Re-apply the most recently undone command.
     * @return False if there was nothing to redo.
     */
    bool redo(Document& document);

    void clear();

    bool canUndo() const { return !m_undoStack.empty(); }
    bool canRedo() const { return !m_redoStack.empty(); }
    int undoCount() const { return static_cast<int>(m_undoStack.size()); }
    int redoCount() const { return static_cast<int>(m_redoStack.size()); }

    /**
     * @brief Page affected by the command that undo() would apply next.
     */
    QString nextUndoPageId() const;
    QString nextRedoPageId() const;

private:
    /**
     * @brief Apply a command forward (insertElement == true) or backward.
     */
    static void apply(Document& document, const HistoryCommand& command, bool insertElement);

    std::vector<HistoryCommand> m_undoStack;
    std::vector<HistoryCommand> m_redoStack;
};
